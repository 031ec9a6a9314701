#include "stategraph/kernel/value_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sg {

std::optional<double> as_number(const StateValue& v) {
    if (!v || !v.IsScalar()) return std::nullopt;
    const std::string& text = v.Scalar();
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
    if (std::isnan(parsed)) return std::nullopt;
    return parsed;
}

bool values_equal(const StateValue& a, const StateValue& b) {
    const bool a_present = a.IsDefined() && !a.IsNull();
    const bool b_present = b.IsDefined() && !b.IsNull();
    if (!a_present || !b_present) return a_present == b_present;
    if (a.Type() != b.Type()) return false;

    switch (a.Type()) {
        case YAML::NodeType::Scalar: {
            if (a.Scalar() == b.Scalar()) return true;
            auto na = as_number(a);
            auto nb = as_number(b);
            return na && nb && *na == *nb;
        }
        case YAML::NodeType::Sequence: {
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!values_equal(a[i], b[i])) return false;
            }
            return true;
        }
        case YAML::NodeType::Map: {
            if (a.size() != b.size()) return false;
            // Keys may be sequences or maps, so they are matched structurally.
            for (const auto& kv : a) {
                bool matched = false;
                for (const auto& other : b) {
                    if (values_equal(kv.first, other.first)) {
                        matched = values_equal(kv.second, other.second);
                        break;
                    }
                }
                if (!matched) return false;
            }
            return true;
        }
        default:
            return true;
    }
}

std::string describe_value(const StateValue& v) {
    if (!v.IsDefined() || v.IsNull()) return "null";
    if (v.IsScalar()) return v.Scalar();
    YAML::Emitter out;
    out << YAML::Flow << v;
    return out.c_str();
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()).count() % 1000;
    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &secs);
#else
    gmtime_r(&secs, &utc);
#endif
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << (ms < 0 ? ms + 1000 : ms) << 'Z';
    return os.str();
}

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace sg
