#pragma once

#include <string>

namespace paygraph {

// Abstract base class defining the contract for user-facing notices.
// This allows the core logic to be decoupled from the specific UI implementation (GUI window, test recorder).
class UserInterface {
public:
    // Displays non-fatal error notices (failed refresh, malformed payload).
    virtual void displayError(const std::string& error) = 0;

    // Displays status messages (graph loaded, edges dropped, refresh in progress).
    virtual void displayStatus(const std::string& status) = 0;

    // Performs any necessary initialization for the UI.
    virtual void initialize() = 0;

    // Performs any necessary cleanup for the UI.
    virtual void shutdown() = 0;

    // Returns true if the UI is a graphical interface, false otherwise.
    virtual bool isGuiMode() const = 0;

    virtual ~UserInterface() = default;
};

} // namespace paygraph
