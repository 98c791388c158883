#include "platform_session.h"

#ifdef _WIN32
#include "log_manager.h"
#include <windows.h>
#include <combaseapi.h>
#endif

PlatformSession::PlatformSession()
{
#ifdef _WIN32
    HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
    // S_FALSE: already initialized on this thread; still needs a balancing CoUninitialize
    m_acquired = SUCCEEDED(hr);
    if (!m_acquired) {
        LogManager::instance().addLog(QString("CoInitializeEx failed: 0x%1")
                                      .arg(QString::number(quint32(hr), 16).toUpper()), "WARN");
    }
#else
    // Nothing to acquire on this platform
    m_acquired = true;
#endif
}

PlatformSession::~PlatformSession()
{
#ifdef _WIN32
    if (m_acquired) CoUninitialize();
#endif
}
