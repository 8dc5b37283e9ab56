#include <erpl_gui/logon/popup_resolver.hpp>

#include <erpl_gui/core/log.hpp>
#include <erpl_gui/core/result.hpp>
#include <erpl_gui/gui/element_access.hpp>

namespace erpl_gui {

namespace {

constexpr const char* kComponent = "popup";

Result<void, Error> PressEnter(IGuiSession& session, const char* window_id) {
    auto window = FindElement(session, window_id);
    if (!window.has_value()) {
        Error error;
        error.operation = "DrainPopups";
        error.target = window_id;
        error.message = "window not found";
        error.category = ErrorCategory::LoginScreen;
        return Result<void, Error>::Err(std::move(error));
    }
    return (*window)->SendVKey(vkey::kEnter);
}

Result<void, Error> ResolveMultipleLogon(IGuiSession& session,
                                         MultipleLogonChoice choice) {
    const bool keep = choice == MultipleLogonChoice::ContinueKeepOthers;
    const char* option_id = keep ? element_id::kMultiLogonContinue
                                 : element_id::kMultiLogonTerminate;
    LogInfo(kComponent, keep
                            ? "multiple logon: continue, keep other sessions"
                            : "multiple logon: continue, terminate other sessions");

    auto option = FindElement(session, option_id);
    if (option.has_value()) {
        auto selected = (*option)->Invoke();
        if (selected.IsErr()) {
            return selected;
        }
    }

    auto confirm = FindElement(session, element_id::kPopupConfirmButton);
    if (confirm.has_value()) {
        return (*confirm)->Invoke();
    }
    return PressEnter(session, element_id::kPopupWindow);
}

} // namespace

PopupKind ClassifyPopup(IGuiSession& session) {
    if (!FindElement(session, element_id::kPopupWindow).has_value()) {
        return PopupKind::None;
    }
    if (FindElement(session, element_id::kMultiLogonTerminate).has_value()) {
        return PopupKind::MultipleLogon;
    }
    return PopupKind::InfoDialog;
}

PopupReport DrainPopups(IGuiSession& session, IClock& clock,
                        const PopupPolicy& policy) {
    PopupReport report;

    for (int i = 0; i < policy.max_iterations; ++i) {
        clock.SleepFor(policy.settle);
        ++report.probes;

        const auto kind = ClassifyPopup(session);
        if (kind == PopupKind::None) {
            return report;
        }

        const auto title = ReadText(session, element_id::kPopupWindow);
        LogInfo(kComponent, "popup detected: '" + title.value_or("") + "' (" +
                                ToString(kind) + ")");

        Result<void, Error> resolved = Result<void, Error>::Ok();
        if (kind == PopupKind::MultipleLogon) {
            resolved = ResolveMultipleLogon(session, policy.multiple_logon);
        } else {
            resolved = PressEnter(session, element_id::kMainWindow);
        }

        if (resolved.IsErr()) {
            LogWarn(kComponent, "popup handling failed: " + resolved.Error().message +
                                    " - trying Enter");
            auto fallback = PressEnter(session, element_id::kMainWindow);
            if (fallback.IsErr()) {
                LogWarn(kComponent, "Enter failed: " + fallback.Error().message);
            }
        }
        report.resolved.push_back(kind);
    }

    // Bound reached: one more look tells whether something is still open.
    if (ClassifyPopup(session) != PopupKind::None) {
        report.exhausted = true;
        LogWarn(kComponent, "popup still open after " +
                                std::to_string(policy.max_iterations) +
                                " attempts - continuing");
    }
    return report;
}

} // namespace erpl_gui
