#include "capture/SourcePortalScreenshot.hpp"

#include <dbus/dbus.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "platform/FileUtil.hpp"

namespace snarp {

namespace {

constexpr const char* kPortalService = "org.freedesktop.portal.Desktop";
constexpr const char* kPortalPath = "/org/freedesktop/portal/desktop";
constexpr const char* kScreenshotIface = "org.freedesktop.portal.Screenshot";
constexpr const char* kRequestIface = "org.freedesktop.portal.Request";
constexpr int kCallTimeoutMs = 5000;
constexpr auto kResponseTimeout = std::chrono::seconds(30);

struct ConnectionUnref {
    void operator()(DBusConnection* conn) const {
        dbus_connection_unref(conn);
    }
};
struct MessageUnref {
    void operator()(DBusMessage* msg) const {
        dbus_message_unref(msg);
    }
};
struct StbiFree {
    void operator()(stbi_uc* data) const {
        stbi_image_free(data);
    }
};

using Connection = std::unique_ptr<DBusConnection, ConnectionUnref>;
using Message = std::unique_ptr<DBusMessage, MessageUnref>;
using Pixels = std::unique_ptr<stbi_uc, StbiFree>;

// DBusError that frees itself and renders as "prefix: message".
class BusError {
public:
    BusError() {
        dbus_error_init(&err_);
    }
    ~BusError() {
        dbus_error_free(&err_);
    }
    BusError(const BusError&) = delete;
    BusError& operator=(const BusError&) = delete;

    DBusError* get() {
        return &err_;
    }
    bool isSet() const {
        return dbus_error_is_set(&err_);
    }
    std::string describe(const char* what) const {
        return std::string("portal: ") + what + ": " +
               (err_.message ? err_.message : "unknown");
    }

private:
    DBusError err_;
};

Connection sessionBus(BusError& err) {
    return Connection(dbus_bus_get(DBUS_BUS_SESSION, err.get()));
}

void appendOption(DBusMessageIter* options, const char* key, int type,
                  const void* value, const char* signature) {
    DBusMessageIter entry;
    DBusMessageIter variant;
    dbus_message_iter_open_container(options, DBUS_TYPE_DICT_ENTRY, nullptr,
                                     &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, signature,
                                     &variant);
    dbus_message_iter_append_basic(&variant, type, value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(options, &entry);
}

// Looks up the string "uri" in the a{sv} results of a Response signal.
bool findUri(DBusMessageIter* results, std::string& uri) {
    DBusMessageIter entries;
    dbus_message_iter_recurse(results, &entries);
    for (; dbus_message_iter_get_arg_type(&entries) == DBUS_TYPE_DICT_ENTRY;
         dbus_message_iter_next(&entries)) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&entries, &entry);
        const char* key = nullptr;
        dbus_message_iter_get_basic(&entry, &key);
        if (!key || std::strcmp(key, "uri") != 0 ||
            !dbus_message_iter_next(&entry) ||
            dbus_message_iter_get_arg_type(&entry) != DBUS_TYPE_VARIANT) {
            continue;
        }
        DBusMessageIter value;
        dbus_message_iter_recurse(&entry, &value);
        if (dbus_message_iter_get_arg_type(&value) != DBUS_TYPE_STRING) {
            continue;
        }
        const char* text = nullptr;
        dbus_message_iter_get_basic(&value, &text);
        if (text) {
            uri = text;
            return true;
        }
    }
    return false;
}

// Response(u response, a{sv} results); response 0 means success.
bool readResponse(DBusMessage* signal, std::string& uri, std::string& err) {
    DBusMessageIter iter;
    if (!dbus_message_iter_init(signal, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_UINT32) {
        err = "portal: malformed Response signal";
        return false;
    }
    std::uint32_t code = 2;
    dbus_message_iter_get_basic(&iter, &code);
    if (code != 0) {
        err = code == 1 ? "portal: screenshot cancelled"
                        : "portal: screenshot failed";
        return false;
    }
    if (!dbus_message_iter_next(&iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY ||
        !findUri(&iter, uri)) {
        err = "portal: Response carried no uri";
        return false;
    }
    return true;
}

// Calls Screenshot and returns the object path of the resulting Request.
bool requestScreenshot(DBusConnection* conn, std::string& handle,
                       std::string& err) {
    Message call(dbus_message_new_method_call(kPortalService, kPortalPath,
                                              kScreenshotIface, "Screenshot"));
    if (!call) {
        err = "portal: failed to create message";
        return false;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(call.get(), &args);
    const char* parentWindow = "";
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &parentWindow);

    DBusMessageIter options;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &options);
    dbus_bool_t interactive = FALSE;
    appendOption(&options, "interactive", DBUS_TYPE_BOOLEAN, &interactive, "b");
    std::string token =
        "snarp" + std::to_string(static_cast<unsigned long long>(
                      std::chrono::steady_clock::now()
                          .time_since_epoch()
                          .count()));
    const char* tokenText = token.c_str();
    appendOption(&options, "handle_token", DBUS_TYPE_STRING, &tokenText, "s");
    dbus_message_iter_close_container(&args, &options);

    BusError busErr;
    Message reply(dbus_connection_send_with_reply_and_block(
        conn, call.get(), kCallTimeoutMs, busErr.get()));
    if (!reply) {
        err = busErr.describe("Screenshot call failed");
        return false;
    }
    const char* path = nullptr;
    if (!dbus_message_get_args(reply.get(), busErr.get(),
                               DBUS_TYPE_OBJECT_PATH, &path,
                               DBUS_TYPE_INVALID) ||
        !path) {
        err = busErr.describe("unexpected reply for Screenshot");
        return false;
    }
    handle = path;
    return true;
}

bool awaitResponse(DBusConnection* conn, const std::string& handle,
                   std::string& uri, std::string& err) {
    std::string rule =
        std::string("type='signal',interface='") + kRequestIface +
        "',member='Response',path='" + handle + "'";
    BusError busErr;
    dbus_bus_add_match(conn, rule.c_str(), busErr.get());
    dbus_connection_flush(conn);
    if (busErr.isSet()) {
        err = busErr.describe("failed to add match");
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + kResponseTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
        dbus_connection_read_write(conn, 100);
        Message signal(dbus_connection_pop_message(conn));
        if (signal &&
            dbus_message_is_signal(signal.get(), kRequestIface, "Response")) {
            return readResponse(signal.get(), uri, err);
        }
    }
    err = "portal: timed out waiting for response";
    return false;
}

// Full-desktop RGBA to a cropped RGB image.
void cropRgba(const stbi_uc* rgba, int fullW, const Region& region,
              Image& out) {
    out.w = region.width();
    out.h = region.height();
    out.order = PixelOrder::RGB;
    out.pixels.resize(out.expectedSize());
    std::uint8_t* dst = out.pixels.data();
    for (int y = region.y(); y < region.bottom(); ++y) {
        const stbi_uc* row = rgba + (static_cast<size_t>(y) * fullW) * 4u;
        for (int x = region.x(); x < region.right(); ++x) {
            const stbi_uc* px = row + static_cast<size_t>(x) * 4u;
            *dst++ = px[0];
            *dst++ = px[1];
            *dst++ = px[2];
        }
    }
}

}  // namespace

// Every capture is a full Screenshot portal round trip, so this source only
// serves still screenshots.
class PortalScreenshotSource final : public IFrameSource {
public:
    explicit PortalScreenshotSource(LogSink& log) : log_(log) {}

    std::string name() const override {
        return "portal-screenshot";
    }

    bool isAvailable() const override {
        BusError err;
        Connection conn = sessionBus(err);
        if (!conn) {
            return false;
        }
        bool owned = dbus_bus_name_has_owner(conn.get(), kPortalService,
                                             err.get());
        return owned && !err.isSet();
    }

    bool supportsContinuous() const override {
        return false;
    }

    bool desktopSize(int& width, int& height) override {
        std::string err;
        if (!takeScreenshot(width, height, err)) {
            LOG_ERROR(log_, "%s", err.c_str());
            return false;
        }
        return true;
    }

    bool capture(const Region& region, Image& out, std::string& err) override {
        int w = 0;
        int h = 0;
        Pixels pixels = takeScreenshot(w, h, err);
        if (!pixels) {
            return false;
        }
        if (region.right() > w || region.bottom() > h) {
            err = "portal: region " + region.toString() +
                  " exceeds screenshot " + std::to_string(w) + "x" +
                  std::to_string(h);
            return false;
        }
        cropRgba(pixels.get(), w, region, out);
        return true;
    }

private:
    Pixels takeScreenshot(int& w, int& h, std::string& err) {
        BusError busErr;
        Connection conn = sessionBus(busErr);
        if (!conn) {
            err = busErr.describe("failed to connect to session bus");
            return nullptr;
        }
        std::string handle;
        std::string uri;
        if (!requestScreenshot(conn.get(), handle, err) ||
            !awaitResponse(conn.get(), handle, uri, err)) {
            return nullptr;
        }

        std::string path = fileUrlToPath(uri);
        int channels = 0;
        Pixels pixels(stbi_load(path.c_str(), &w, &h, &channels, 4));
        // The portal hands over ownership of the file.
        std::remove(path.c_str());
        if (!pixels) {
            err = "portal: failed to load screenshot " + path;
            return nullptr;
        }
        LOG_DEBUG(log_, "portal: screenshot %dx%d", w, h);
        return pixels;
    }

    LogSink& log_;
};

std::unique_ptr<IFrameSource> CreateSourcePortalScreenshot(LogSink& log) {
    return std::make_unique<PortalScreenshotSource>(log);
}

}  // namespace snarp
