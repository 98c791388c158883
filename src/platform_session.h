#pragma once

// Scoped acquisition of per-thread platform state needed by the native dialogs
// (COM on Windows). Acquired before any dialog or file-system work and released
// on every exit path when the guard goes out of scope.
class PlatformSession {
public:
    PlatformSession();
    ~PlatformSession();

    PlatformSession(const PlatformSession&) = delete;
    PlatformSession& operator=(const PlatformSession&) = delete;

    bool isAcquired() const { return m_acquired; }

private:
    bool m_acquired = false;
};
