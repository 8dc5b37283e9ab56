#pragma once

#include <erpl_gui/core/poll.hpp>
#include <erpl_gui/core/types.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>

#include <chrono>
#include <vector>

namespace erpl_gui {

struct PopupPolicy {
    MultipleLogonChoice multiple_logon = MultipleLogonChoice::ContinueKeepOthers;
    int max_iterations = 5;
    std::chrono::milliseconds settle{500};
};

// ---------------------------------------------------------------------------
// PopupReport - what DrainPopups did, in order.
// ---------------------------------------------------------------------------
struct PopupReport {
    std::vector<PopupKind> resolved;
    int probes = 0;
    bool exhausted = false;  // wnd[1] still present after max_iterations
};

/// Shape of the current modal window: None when wnd[1] is absent,
/// MultipleLogon when the multiple logon radio buttons are present,
/// otherwise InfoDialog.
PopupKind ClassifyPopup(IGuiSession& session);

// ---------------------------------------------------------------------------
// DrainPopups - dismiss post-logon modal windows until none is left.
//
// Each iteration sleeps `policy.settle`, probes wnd[1] and resolves it:
//   MultipleLogon  select OPT2 (keep) or OPT1 (terminate), press
//                  wnd[1]/tbar[0]/btn[0], or Enter on wnd[1] without it
//   InfoDialog     Enter on wnd[0]
// At most `policy.max_iterations` probes. Never fails: a resolution that
// errors is logged and followed by a plain Enter on wnd[0].
// ---------------------------------------------------------------------------
PopupReport DrainPopups(IGuiSession& session, IClock& clock,
                        const PopupPolicy& policy = {});

} // namespace erpl_gui
