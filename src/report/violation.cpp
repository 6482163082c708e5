#include "strata/report/violation.hpp"

#include <type_traits>

namespace strata::report {

auto severity_name(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    }
    return "invalid";
}

auto parse_severity(std::string_view name) -> std::optional<Severity> {
    if (name == "info") {
        return Severity::Info;
    }
    if (name == "warning") {
        return Severity::Warning;
    }
    if (name == "error") {
        return Severity::Error;
    }
    return std::nullopt;
}

auto is_valid_severity(Severity severity) -> bool {
    return static_cast<uint8_t>(severity) <= static_cast<uint8_t>(Severity::Error);
}

auto downgrade(Severity severity) -> Severity {
    switch (severity) {
    case Severity::Error:
        return Severity::Warning;
    case Severity::Warning:
    case Severity::Info:
        return Severity::Info;
    }
    return severity;
}

auto category_name(Category category) -> const char* {
    switch (category) {
    case Category::Direction:
        return "direction";
    case Category::IoIsolation:
        return "io-isolation";
    case Category::Boundary:
        return "boundary";
    case Category::ErrorShape:
        return "error-shape";
    case Category::Cycle:
        return "cycle";
    case Category::ParseFailure:
        return "parse-failure";
    case Category::ConfigGap:
        return "config-gap";
    case Category::AmbiguousImport:
        return "ambiguous-import";
    }
    return "unknown";
}

auto detail_category(const ViolationDetail& detail) -> Category {
    return std::visit(
        [](const auto& d) -> Category {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, DirectionDetail>) {
                return Category::Direction;
            } else if constexpr (std::is_same_v<T, IoIsolationDetail>) {
                return Category::IoIsolation;
            } else if constexpr (std::is_same_v<T, BoundaryDetail>) {
                return Category::Boundary;
            } else if constexpr (std::is_same_v<T, ErrorShapeDetail>) {
                return Category::ErrorShape;
            } else if constexpr (std::is_same_v<T, CycleDetail>) {
                return Category::Cycle;
            } else if constexpr (std::is_same_v<T, ParseFailureDetail>) {
                return Category::ParseFailure;
            } else if constexpr (std::is_same_v<T, ConfigGapDetail>) {
                return Category::ConfigGap;
            } else {
                static_assert(std::is_same_v<T, AmbiguousImportDetail>);
                return Category::AmbiguousImport;
            }
        },
        detail);
}

auto format_location(const Violation& violation) -> std::string {
    if (!violation.line_range) {
        return violation.path;
    }
    auto out = violation.path + ":" + std::to_string(violation.line_range->begin);
    if (violation.line_range->end != violation.line_range->begin) {
        out += "-" + std::to_string(violation.line_range->end);
    }
    return out;
}

} // namespace strata::report
