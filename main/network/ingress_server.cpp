#include <main/network/ingress_server.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <cstring>

static const char* TAG = "IngressServer";

IngressSink::SubmitResult QueueIngressSink::submit(const TelemetryReport& report) {
    if (queue == nullptr) {
        return SubmitResult::UNAVAILABLE;
    }
    if (admit != nullptr && !admit(ctx, report.device_id)) {
        return SubmitResult::UNAVAILABLE;
    }
    if (xQueueSend(queue, &report, 0) != pdTRUE) {
        return SubmitResult::UNAVAILABLE;
    }
    return SubmitResult::ACCEPTED;
}

IngressServer::IngressServer(IngressSink* sink_in)
    : sink(sink_in), server(nullptr) {}

bool IngressServer::start() {
    if (server != nullptr) {
        return true;
    }
    httpd_config_t config = HTTPD_DEFAULT_CONFIG();
    config.server_port = Config::Http::port;
    config.lru_purge_enable = true;

    esp_err_t err = httpd_start(&server, &config);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "httpd_start failed: %d", static_cast<int>(err));
        server = nullptr;
        return false;
    }

    httpd_uri_t uri = {};
    uri.uri = Config::Http::telemetry_uri;
    uri.method = HTTP_POST;
    uri.handler = &IngressServer::postTelemetryHandler;
    uri.user_ctx = this;
    err = httpd_register_uri_handler(server, &uri);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "URI registration failed: %d", static_cast<int>(err));
        stop();
        return false;
    }
    LOG_INFO(TAG, "Listening on :%u%s", static_cast<unsigned>(Config::Http::port), Config::Http::telemetry_uri);
    return true;
}

void IngressServer::stop() {
    if (server != nullptr) {
        (void)httpd_stop(server);
        server = nullptr;
    }
}

esp_err_t IngressServer::respond(httpd_req_t* req, const IngressResponse& response) {
    const char* status = "200 OK";
    switch (response.status) {
        case 200: status = "200 OK"; break;
        case 400: status = "400 Bad Request"; break;
        case 503: status = "503 Service Unavailable"; break;
        default:  status = "500 Internal Server Error"; break;
    }
    httpd_resp_set_status(req, status);
    httpd_resp_set_type(req, "application/json");
    return httpd_resp_send(req, response.body, HTTPD_RESP_USE_STRLEN);
}

esp_err_t IngressServer::postTelemetryHandler(httpd_req_t* req) {
    auto* self = static_cast<IngressServer*>(req->user_ctx);

    if (req->content_len > Config::Console::ingress_body_max_len) {
        LOG_WARN(TAG, "Rejecting %u byte body", static_cast<unsigned>(req->content_len));
        return respond(req, IngressHandler::payloadTooLarge());
    }

    char body[Config::Console::ingress_body_max_len + 1];
    size_t received = 0;
    int timeouts = 0;
    while (received < req->content_len) {
        int n = httpd_req_recv(req, body + received, req->content_len - received);
        if (n == HTTPD_SOCK_ERR_TIMEOUT && ++timeouts < 3) {
            continue;
        }
        if (n <= 0) {
            LOG_WARN(TAG, "Body read failed: %d", n);
            return respond(req, IngressHandler::readFailed());
        }
        received += static_cast<size_t>(n);
    }
    body[received] = '\0';

    IngressResponse response = IngressHandler::handle(body, static_cast<int>(received), self->sink);
    if (response.status != 200) {
        LOG_WARN(TAG, "POST %s -> %d %s", Config::Http::telemetry_uri, response.status, response.body);
    }
    return respond(req, response);
}
