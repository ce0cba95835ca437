// D-Bus client for KDE Klipper (org.kde.klipper /klipper)
// Every call is synchronous and bounded by the configured timeout.

#include "clipexpire/KlipperGateway.hpp"
#include "clipexpire/Errors.hpp"
#include "clipexpire/HistoryRewrite.hpp"
#include <memory>

namespace clipexpire {

namespace {

struct VariantUnref {
    void operator()(GVariant* v) const { if (v) g_variant_unref(v); }
};
using VariantPtr = std::unique_ptr<GVariant, VariantUnref>;

std::string takeErrorMessage(GError* error) {
    std::string message = error ? error->message : "unknown error";
    if (error) g_error_free(error);
    return message;
}

} // namespace

KlipperGateway::KlipperGateway(GDBusConnection* connection, std::chrono::milliseconds timeout)
    : m_connection(G_DBUS_CONNECTION(g_object_ref(connection))),
      m_timeout(timeout) {
}

KlipperGateway::~KlipperGateway() {
    unsubscribeHistoryChanged();
    g_object_unref(m_connection);
}

GDBusConnection* KlipperGateway::connectSessionBus() {
    GError* error = nullptr;
    GDBusConnection* connection = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &error);
    if (!connection) {
        throw GatewayError("connecting to D-Bus session bus: " + takeErrorMessage(error));
    }
    return connection;
}

// ============================================================================
// D-Bus plumbing
// ============================================================================

GVariant* KlipperGateway::call(const char* method, GVariant* params, const GVariantType* replyType) {
    GError* error = nullptr;
    GVariant* reply = g_dbus_connection_call_sync(
        m_connection, BUS_NAME, OBJECT_PATH, INTERFACE, method,
        params, replyType, G_DBUS_CALL_FLAGS_NONE,
        static_cast<gint>(m_timeout.count()), nullptr, &error);

    if (!reply) {
        throw GatewayError(std::string("Klipper ") + method + ": " + takeErrorMessage(error));
    }
    return reply;
}

void KlipperGateway::clearHistory() {
    VariantPtr reply(call("clearClipboardHistory", nullptr, nullptr));
}

// ============================================================================
// ClipboardGateway
// ============================================================================

std::vector<ClipboardItem> KlipperGateway::listHistory() {
    VariantPtr reply(call("getClipboardHistoryMenu", nullptr, G_VARIANT_TYPE("(as)")));
    VariantPtr array(g_variant_get_child_value(reply.get(), 0));

    gsize count = 0;
    const gchar** strings = g_variant_get_strv(array.get(), &count);

    std::vector<ClipboardItem> items;
    items.reserve(count);
    for (gsize i = 0; i < count; i++) {
        items.push_back({strings[i], static_cast<std::size_t>(i)});
    }
    g_free(strings);

    return items;
}

// Klipper has no per-entry delete: clear the history once and add back what
// remains, oldest first, so the surviving order is unchanged.
std::vector<RemoveResult> KlipperGateway::remove(const std::vector<ClipboardItem>& items) {
    RewritePlan plan = planRewrite(listHistory(), items);

    HistoryWriter writer;
    writer.clear = [this]() { clearHistory(); };
    writer.add = [this](const std::string& text) { setSelection(text); };
    writer.selection = [this]() { return currentSelection(); };
    applyRewrite(plan, writer);

    return plan.results;
}

std::string KlipperGateway::currentSelection() {
    VariantPtr reply(call("getClipboardContents", nullptr, G_VARIANT_TYPE("(s)")));

    const gchar* contents = nullptr;
    g_variant_get(reply.get(), "(&s)", &contents);
    return contents ? contents : "";
}

void KlipperGateway::setSelection(const std::string& text) {
    VariantPtr reply(call("setClipboardContents", g_variant_new("(s)", text.c_str()), nullptr));
}

bool KlipperGateway::subscribeHistoryChanged(std::function<void()> callback) {
    unsubscribeHistoryChanged();

    m_onHistoryChanged = std::move(callback);
    m_signalId = g_dbus_connection_signal_subscribe(
        m_connection, BUS_NAME, INTERFACE, "clipboardHistoryUpdated", OBJECT_PATH,
        nullptr, G_DBUS_SIGNAL_FLAGS_NONE, onSignal, this, nullptr);

    return m_signalId != 0;
}

void KlipperGateway::unsubscribeHistoryChanged() {
    if (m_signalId != 0) {
        g_dbus_connection_signal_unsubscribe(m_connection, m_signalId);
        m_signalId = 0;
    }
    m_onHistoryChanged = nullptr;
}

void KlipperGateway::onSignal(GDBusConnection*, const gchar*, const gchar*, const gchar*,
                              const gchar*, GVariant*, gpointer data) {
    auto* self = static_cast<KlipperGateway*>(data);
    if (self->m_onHistoryChanged) {
        self->m_onHistoryChanged();
    }
}

} // namespace clipexpire
