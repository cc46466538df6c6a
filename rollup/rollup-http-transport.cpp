#include <string>
#include <utility>

#include "rollup-errors.h"
#include "rollup-http-transport.h"
#include "rollup-signals.h"

using namespace std::string_literals;

namespace dapp {

// Longest time spent inside a single mg_mgr_poll before checking timeouts and shutdown requests
constexpr int POLL_SLICE_MS = 100;

namespace {

/// \brief State of a single request/response exchange, shared with the Mongoose handler
struct http_exchange_type {
    std::string url;                  ///< Full request URL
    const char *method{nullptr};      ///< Request method
    const char *content_type{nullptr}; ///< Body content type, or nullptr for requests without body
    const std::string *body{nullptr}; ///< Request body
    http_response_type response;      ///< Response, once received
    std::string error;                ///< Connection error, if any
    bool done{false};                 ///< Response received or exchange abandoned
    bool closed{false};               ///< Connection released by Mongoose
};

} // namespace

/// \brief Handler for HTTP client connections
/// \param con Mongoose connection
/// \param ev Mongoose event
/// \param ev_data Mongoose event data
/// \param fn_data Exchange this connection belongs to
static void http_client_handler(mg_connection *con, int ev, void *ev_data, void *fn_data) {
    auto *x = static_cast<http_exchange_type *>(fn_data);
    if (ev == MG_EV_CONNECT) {
        const mg_str host = mg_url_host(x->url.c_str());
        std::string headers;
        headers += std::string(x->method) + " "s + mg_url_uri(x->url.c_str()) + " HTTP/1.1\r\n"s;
        headers += "Host: "s + std::string(host.ptr, host.len) + "\r\n"s;
        if (x->content_type) {
            headers += "Content-Type: "s + x->content_type + "\r\n"s;
        }
        headers += "Content-Length: "s + std::to_string(x->body->size()) + "\r\n"s;
        headers += "Connection: close\r\n\r\n";
        mg_send(con, headers.data(), headers.size());
        mg_send(con, x->body->data(), x->body->size());
        return;
    }
    if (ev == MG_EV_HTTP_MSG) {
        auto *hm = static_cast<mg_http_message *>(ev_data);
        x->response.status = mg_http_status(hm);
        x->response.body.assign(hm->body.ptr, hm->body.len);
        x->done = true;
        con->is_closing = 1;
        return;
    }
    if (ev == MG_EV_ERROR) {
        if (!x->done) {
            x->error = static_cast<const char *>(ev_data);
            x->done = true;
        }
        return;
    }
    if (ev == MG_EV_CLOSE) {
        if (!x->done) {
            x->error = "connection closed before response";
            x->done = true;
        }
        x->closed = true;
        return;
    }
}

mongoose_http_transport::mongoose_http_transport(std::string base_url, uint64_t timeout_ms) :
    m_base_url(std::move(base_url)),
    m_timeout_ms(timeout_ms),
    m_event_manager{} {
    // Base URL is joined with absolute paths
    while (!m_base_url.empty() && m_base_url.back() == '/') {
        m_base_url.pop_back();
    }
    mg_mgr_init(&m_event_manager);
}

mongoose_http_transport::~mongoose_http_transport() {
    mg_mgr_free(&m_event_manager);
}

http_response_type mongoose_http_transport::post(const std::string &path, const std::string &body) {
    return exchange("POST", path, "application/json", body);
}

http_response_type mongoose_http_transport::post_octets(const std::string &path, const std::string &body) {
    return exchange("POST", path, "application/octet-stream", body);
}

http_response_type mongoose_http_transport::get(const std::string &path) {
    static const std::string no_body;
    return exchange("GET", path, nullptr, no_body);
}

void mongoose_http_transport::wait_before_retry(void) {
    // Keeps the event manager serviced while idle
    mg_mgr_poll(&m_event_manager, POLL_SLICE_MS);
}

http_response_type mongoose_http_transport::exchange(const char *method, const std::string &path,
    const char *content_type, const std::string &body) {
    http_exchange_type x;
    x.url = m_base_url + path;
    x.method = method;
    x.content_type = content_type;
    x.body = &body;
    auto *con = mg_http_connect(&m_event_manager, x.url.c_str(), http_client_handler, &x);
    if (!con) {
        throw transport_error("unable to connect to "s + x.url);
    }
    const auto start = static_cast<uint64_t>(mg_millis());
    bool interrupted = false;
    bool timed_out = false;
    // Keep polling until Mongoose lets go of the connection, since it refers to x
    while (!x.closed) {
        mg_mgr_poll(&m_event_manager, POLL_SLICE_MS);
        if (x.closed || x.done) {
            continue;
        }
        if (shutdown_requested()) {
            interrupted = true;
        } else if (m_timeout_ms != 0 && static_cast<uint64_t>(mg_millis()) - start > m_timeout_ms) {
            timed_out = true;
        }
        if (interrupted || timed_out) {
            x.done = true;
            con->is_closing = 1;
        }
    }
    if (interrupted) {
        throw shutdown_requested_error{};
    }
    if (timed_out) {
        throw transport_error("timeout waiting for response from "s + x.url);
    }
    if (!x.error.empty()) {
        throw transport_error("request to "s + x.url + " failed ("s + x.error + ")"s);
    }
    return x.response;
}

} // namespace dapp
