#ifndef INGRESS_SERVER_HPP
#define INGRESS_SERVER_HPP

#include <esp_http_server.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <main/console/ingress_handler.hpp>

// Hands accepted reports to the console task without blocking on the queue.
// The optional admit hook runs first; a device it refuses is reported as
// unavailable instead of being queued and dropped later.
class QueueIngressSink : public IngressSink {
public:
    using AdmitFn = bool (*)(void* ctx, const char* device_id);

    explicit QueueIngressSink(QueueHandle_t report_queue, AdmitFn admit_fn = nullptr, void* admit_ctx = nullptr)
        : queue(report_queue), admit(admit_fn), ctx(admit_ctx) {}

    SubmitResult submit(const TelemetryReport& report) override;

private:
    QueueHandle_t queue;
    AdmitFn admit;
    void* ctx;
};

// HTTP front end for POST /telemetry on esp_http_server
class IngressServer {
public:
    explicit IngressServer(IngressSink* sink);

    bool start();
    void stop();
    bool isRunning() const { return server != nullptr; }

private:
    static esp_err_t postTelemetryHandler(httpd_req_t* req);
    static esp_err_t respond(httpd_req_t* req, const IngressResponse& response);

    IngressSink* sink;
    httpd_handle_t server;
};

#endif // INGRESS_SERVER_HPP
