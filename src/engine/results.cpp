#include "docqa/engine/results.hpp"

namespace docqa::engine {

auto to_string(DuplicateAction a) noexcept -> std::string_view {
    switch (a) {
        case DuplicateAction::Auto: return "auto";
        case DuplicateAction::UseExisting: return "use_existing";
        case DuplicateAction::Replace: return "replace";
        case DuplicateAction::Cancel: return "cancel";
    }
    return "auto";
}

auto parse_duplicate_action(std::string_view s) -> std::optional<DuplicateAction> {
    if (s.empty() || s == "auto") return DuplicateAction::Auto;
    if (s == "use_existing") return DuplicateAction::UseExisting;
    if (s == "replace") return DuplicateAction::Replace;
    if (s == "cancel") return DuplicateAction::Cancel;
    return std::nullopt;
}

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
} // namespace

auto status_name(const UploadOutcome& o) noexcept -> std::string_view {
    return std::visit(overloaded{
        [](const UploadSuccess&) -> std::string_view { return "success"; },
        [](const UploadDuplicate&) -> std::string_view { return "duplicate"; },
        [](const UploadCancelled&) -> std::string_view { return "cancelled"; },
        [](const UploadError&) -> std::string_view { return "error"; },
    }, o);
}

} // namespace docqa::engine
