///// Otter: Win32 Raw Input (Maus + Tastatur) mit INPUTSINK; WM_INPUT -> RawInputMap -> Normalizer.
///// Schneefuchs: GetRawInputData zweistufig (Groesse, dann Daten); DefWindowProc immer aufrufen.
///// Maus: Kein eigener Thread; GLFW pumpt die Nachrichten des Threads in glfwPollEvents.
///// Datei: src/system_input.cpp

#include "pch.hpp"
#include "system_input.hpp"
#include "app_state.hpp"
#include "frosch_log.hpp"
#include "raw_input_map.hpp"
#include "settings.hpp"

namespace frosch {

#if defined(_WIN32)

static_assert(RawInputMap::kKeyBreak == RI_KEY_BREAK, "RI_KEY_BREAK mismatch");
static_assert(RawInputMap::kMouseLeftDown == RI_MOUSE_LEFT_BUTTON_DOWN, "RI_MOUSE_LEFT_BUTTON_DOWN mismatch");
static_assert(RawInputMap::kMouseLeftUp == RI_MOUSE_LEFT_BUTTON_UP, "RI_MOUSE_LEFT_BUTTON_UP mismatch");
static_assert(RawInputMap::kVirtualKeyEscape == VK_ESCAPE, "VK_ESCAPE mismatch");

namespace {

    constexpr const wchar_t* kSinkClassName = L"FroschRawInputSink";

    void queueAll(AppState& s, const std::vector<RawInputEvent>& events) {
        for (const RawInputEvent& ev : events) {
            if (auto edge = s.input.normalize(ev)) s.pendingEdges.push_back(*edge);
        }
    }

    void handleRawInput(AppState& s, LPARAM lParam) {
        UINT size = 0;
        if (GetRawInputData(reinterpret_cast<HRAWINPUT>(lParam), RID_INPUT, nullptr, &size,
                            sizeof(RAWINPUTHEADER)) != 0 || size == 0) {
            return;
        }

        std::vector<BYTE> buf(size);
        if (GetRawInputData(reinterpret_cast<HRAWINPUT>(lParam), RID_INPUT, buf.data(), &size,
                            sizeof(RAWINPUTHEADER)) != size) {
            return;
        }

        const RAWINPUT* ri = reinterpret_cast<const RAWINPUT*>(buf.data());
        const double now = glfwGetTime();
        if (ri->header.dwType == RIM_TYPEKEYBOARD) {
            const RAWKEYBOARD& kb = ri->data.keyboard;
            queueAll(s, RawInputMap::fromKeyboard(static_cast<int>(kb.VKey), kb.Flags, now));
        } else if (ri->header.dwType == RIM_TYPEMOUSE) {
            queueAll(s, RawInputMap::fromMouseButtons(ri->data.mouse.usButtonFlags, now));
        }
    }

    LRESULT CALLBACK sinkWndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam) {
        if (msg == WM_INPUT) {
            if (auto* s = reinterpret_cast<AppState*>(GetWindowLongPtrW(hwnd, GWLP_USERDATA))) {
                handleRawInput(*s, lParam);
            }
        }
        return DefWindowProcW(hwnd, msg, wParam, lParam);
    }

    bool registerDevices(HWND target, DWORD flags) {
        RAWINPUTDEVICE rids[2]{};

        // Mouse: UsagePage=GenericDesktop(0x01), Usage=Mouse(0x02)
        rids[0].usUsagePage = 0x01;
        rids[0].usUsage     = 0x02;
        rids[0].dwFlags     = flags;
        rids[0].hwndTarget  = target;

        // Keyboard: UsagePage=GenericDesktop(0x01), Usage=Keyboard(0x06)
        rids[1].usUsagePage = 0x01;
        rids[1].usUsage     = 0x06;
        rids[1].dwFlags     = flags;
        rids[1].hwndTarget  = target;

        return RegisterRawInputDevices(rids, 2, sizeof(RAWINPUTDEVICE)) != FALSE;
    }

} // namespace

bool SystemInputListener::start(AppState& state) {
    if constexpr (!Settings::systemWideInput) {
        (void)state;
        FROSCH_LOG_HOST("[INPUT] system-wide input disabled by settings");
        return false;
    }
    if (active_) return true;

    HINSTANCE inst = GetModuleHandleW(nullptr);
    WNDCLASSEXW wc{};
    wc.cbSize        = sizeof(wc);
    wc.lpfnWndProc   = sinkWndProc;
    wc.hInstance     = inst;
    wc.lpszClassName = kSinkClassName;
    if (!RegisterClassExW(&wc) && GetLastError() != ERROR_CLASS_ALREADY_EXISTS) {
        FROSCH_LOG_HOST("[INPUT] RegisterClassExW failed err=%lu", GetLastError());
        return false;
    }

    HWND hwnd = CreateWindowExW(0, kSinkClassName, L"", 0, 0, 0, 0, 0,
                                HWND_MESSAGE, nullptr, inst, nullptr);
    if (!hwnd) {
        FROSCH_LOG_HOST("[INPUT] message-only window failed err=%lu", GetLastError());
        UnregisterClassW(kSinkClassName, inst);
        return false;
    }
    SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(&state));

    if (!registerDevices(hwnd, RIDEV_INPUTSINK)) {
        FROSCH_LOG_HOST("[INPUT] RegisterRawInputDevices failed err=%lu", GetLastError());
        DestroyWindow(hwnd);
        UnregisterClassW(kSinkClassName, inst);
        return false;
    }

    state_  = &state;
    window_ = hwnd;
    active_ = true;
    FROSCH_LOG_HOST("[INPUT] system-wide keyboard/mouse listener active (raw input sink)");
    return true;
}

void SystemInputListener::stop() {
    if (!active_) return;

    if (!registerDevices(nullptr, RIDEV_REMOVE)) {
        FROSCH_LOG_HOST("[INPUT] raw input unregister failed err=%lu", GetLastError());
    }
    HWND hwnd = static_cast<HWND>(window_);
    SetWindowLongPtrW(hwnd, GWLP_USERDATA, 0);
    DestroyWindow(hwnd);
    UnregisterClassW(kSinkClassName, GetModuleHandleW(nullptr));

    if (auto edge = state_->input.releaseChannel(InputChannel::System, glfwGetTime())) {
        state_->pendingEdges.push_back(*edge);
    }

    window_ = nullptr;
    state_  = nullptr;
    active_ = false;
    FROSCH_LOG_HOST("[INPUT] system-wide listener stopped");
}

#else

// No system-wide hook here; keyboard/mouse are seen only while our window has focus.
bool SystemInputListener::start(AppState& state) {
    (void)state;
    FROSCH_LOG_HOST("[INPUT] system-wide input not available on this platform; keyboard/mouse need window focus");
    return false;
}

void SystemInputListener::stop() {
    active_ = false;
}

#endif

SystemInputListener::~SystemInputListener() {
    stop();
}

} // namespace frosch
