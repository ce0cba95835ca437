#pragma once
// Single Responsibility: ClipboardGateway over D-Bus to KDE Klipper (GDBus)

#include "ClipboardGateway.hpp"
#include <gio/gio.h>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace clipexpire {

class KlipperGateway : public ClipboardGateway {
public:
    static constexpr const char* BUS_NAME = "org.kde.klipper";
    static constexpr const char* OBJECT_PATH = "/klipper";
    static constexpr const char* INTERFACE = "org.kde.klipper.klipper";

    // Takes its own reference on the connection
    KlipperGateway(GDBusConnection* connection, std::chrono::milliseconds timeout);
    ~KlipperGateway() override;

    KlipperGateway(const KlipperGateway&) = delete;
    KlipperGateway& operator=(const KlipperGateway&) = delete;

    // Connect to the session bus. Throws GatewayError.
    static GDBusConnection* connectSessionBus();

    std::vector<ClipboardItem> listHistory() override;
    std::vector<RemoveResult> remove(const std::vector<ClipboardItem>& items) override;
    std::string currentSelection() override;
    void setSelection(const std::string& text) override;
    bool subscribeHistoryChanged(std::function<void()> callback) override;
    void unsubscribeHistoryChanged() override;

private:
    GDBusConnection* m_connection = nullptr;
    std::chrono::milliseconds m_timeout;
    guint m_signalId = 0;
    std::function<void()> m_onHistoryChanged;

    // Synchronous method call; returns the reply (caller unrefs). Throws GatewayError.
    GVariant* call(const char* method, GVariant* params, const GVariantType* replyType);
    void clearHistory();

    static void onSignal(GDBusConnection* connection, const gchar* sender,
                         const gchar* objectPath, const gchar* interfaceName,
                         const gchar* signalName, GVariant* parameters, gpointer data);
};

} // namespace clipexpire
