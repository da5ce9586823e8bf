/**
 * ControllerClient.h - HTTPClient binding of ControllerLink
 *
 * One HTTPClient session per call, closed on every exit path.
 * Calls block the HTTP task for up to CONTROLLER_HTTP_TIMEOUT_MS.
 * The endpoint can be changed at runtime (POST /api/system/config);
 * the relay task reads it when opening the controller socket.
 */

#pragma once

#include <Arduino.h>
#include <HTTPClient.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <string>
#include "communication/ControllerLink.h"

struct ControllerEndpoint {
    std::string host;
    uint16_t port = 0;
};

class ControllerClient : public ControllerLink {
public:
    ControllerClient(const std::string& host, uint16_t port);
    ~ControllerClient() override;

    ControllerClient(const ControllerClient&) = delete;
    ControllerClient& operator=(const ControllerClient&) = delete;

    ControllerResult sendScript(const std::string& script) override;
    ControllerResult fetchInfo() override;
    std::string baseUrl() const override;

    void setEndpoint(const std::string& host, uint16_t port);
    ControllerEndpoint endpoint() const;

private:
    /** begin() in the constructor, end() in the destructor */
    class HttpSession {
    public:
        explicit HttpSession(const String& url);
        ~HttpSession() { _http.end(); }
        HttpSession(const HttpSession&) = delete;
        HttpSession& operator=(const HttpSession&) = delete;

        bool ok() const { return _began; }
        HTTPClient& http() { return _http; }

    private:
        HTTPClient _http;
        bool _began = false;
    };

    ControllerResult exchange(const char* path, ControllerOperation op, const std::string* body);

    ControllerEndpoint _endpoint;
    SemaphoreHandle_t _mutex = nullptr;
};
