// Fuzz target for cursors: drives two cursors over one recorder with an
// arbitrary operation stream and checks every result against a model of
// the recorded history (replay equivalence, at-most-once pulls, range
// checks on backtrack).

#include <backtrack-cpp/backtrack.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <vector>

namespace bt = backtrack_cpp;

namespace {

void check(bool ok) {
    if (!ok) std::abort();
}

// The value the source produces at a given position.
auto expected_at(std::size_t index) -> std::uint32_t {
    return static_cast<std::uint32_t>(index * 2654435761u);
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) return 0;

    const auto length = static_cast<std::size_t>(data[0]);
    auto produced = std::size_t{0};
    auto calls = std::size_t{0};
    auto rec = bt::Recorder<std::uint32_t>{
        [&produced, &calls, length]() -> std::optional<std::uint32_t> {
            ++calls;
            if (produced == length) return std::nullopt;
            return expected_at(produced++);
        }};

    auto copying = rec.copying();
    auto referencing = rec.referencing();
    auto copying_pos = std::size_t{0};
    auto referencing_pos = std::size_t{0};
    auto marks = std::vector<bt::Mark>{};

    for (std::size_t i = 1; i < size; ++i) {
        const auto op = data[i] & 0x7;
        const auto arg = static_cast<std::size_t>(data[i] >> 3);

        switch (op) {
            case 0: {
                auto v = copying.next();
                if (copying_pos < length) {
                    check(v.has_value() && *v == expected_at(copying_pos));
                    ++copying_pos;
                } else {
                    check(!v.has_value());
                }
                break;
            }
            case 1: {
                const auto* v = referencing.next();
                if (referencing_pos < length) {
                    check(v != nullptr && *v == expected_at(referencing_pos));
                    check(v == &rec.history()->at(referencing_pos));
                    ++referencing_pos;
                } else {
                    check(v == nullptr);
                }
                break;
            }
            case 2:
                marks.push_back(copying.get_ref_point());
                check(marks.back().position == copying_pos);
                break;
            case 3:
                if (!marks.empty()) {
                    auto m = marks[arg % marks.size()];
                    referencing.backtrack(m);
                    referencing_pos = m.position;
                }
                break;
            case 4: {
                auto target = bt::Mark{arg};
                try {
                    copying.backtrack(target);
                    check(arg <= rec.size());
                    copying_pos = arg;
                } catch (const bt::BacktrackError& e) {
                    check(arg > rec.size());
                    check(e.kind() == bt::ErrorKind::out_of_range);
                }
                check(copying.get_ref_point().position == copying_pos);
                break;
            }
            case 5: {
                auto wb = copying.walk_back();
                for (auto pos = copying_pos; pos > 0; --pos) {
                    auto v = wb.next();
                    check(v.has_value() && *v == expected_at(pos - 1));
                }
                check(!wb.next().has_value());
                break;
            }
            case 6:
                copying.start_again();
                copying_pos = 0;
                break;
            default: {
                // A copy advances without moving the original.
                auto fork = copying;
                auto v = fork.next();
                check(v.has_value() == (copying_pos < length));
                check(copying.get_ref_point().position == copying_pos);
                break;
            }
        }

        // The source runs once per recorded item, plus at most one final
        // call that reports the end.
        check(produced == rec.size());
        check(calls == rec.size() + (rec.exhausted() ? 1 : 0));
    }

    return 0;
}
