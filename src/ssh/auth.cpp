#include "auth.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <cstring>
#include <filesystem>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        if (data->callback && prompt_text.find("assword") != std::string::npos) {
            data->callback("Sending password...");
        }
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static bool try_publickey(LIBSSH2_SESSION* session, const HostConfig& host,
                          StatusCallback callback) {
    std::string key = expand_home(*host.ssh_key_path);
    std::string pub = key + ".pub";
    if (!std::filesystem::exists(key)) {
        if (callback) callback("Key not found: " + key);
        return false;
    }
    if (callback) callback("Using public key " + key + "...");

    const char* pub_path = std::filesystem::exists(pub) ? pub.c_str() : nullptr;
    const char* passphrase = host.password.empty() ? nullptr : host.password.c_str();

    int ret;
    while ((ret = libssh2_userauth_publickey_fromfile_ex(
                session, host.user.c_str(), static_cast<unsigned int>(host.user.length()),
                pub_path, key.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }
    return ret == 0;
}

SSHResult authenticate(LIBSSH2_SESSION* session, const HostConfig& host,
                       StatusCallback callback) {
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session, host.user.c_str(),
                                              static_cast<unsigned int>(host.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session)) {
            return SSHResult{0, "", ""};  // "none" was accepted
        }
        if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(100);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    if (host.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (try_publickey(session, host, callback)) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        if (callback) callback("Public key rejected, trying password...");
    }

    if (host.password.empty()) {
        return SSHResult{-1, "", "Authentication failed (no accepted key and no password)"};
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = host.password;
        kbd_data.prompt_round = 0;
        kbd_data.callback = callback;

        *libssh2_session_abstract(session) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session,
                host.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        *libssh2_session_abstract(session) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }

        if (callback) callback("Keyboard-interactive failed, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session,
                host.user.c_str(), host.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check username/password)"};
}
