// Lamina Unit Tests - Shared helpers
// Shell workers, capturing sinks and loop helpers

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../../src/core/event_loop.hpp"
#include "../../src/runtime/bootstrap.hpp"
#include "../../src/runtime/log_sink.hpp"
#include "../../src/runtime/worker_supervisor.hpp"

namespace lamina::test {

// Worker used instead of Node: `/bin/sh <script> <entry> <handler>`.
// The entry selects the behaviour. The event arrives as one JSON line on fd 3;
// keys are sorted, so the last "id" is the correlation id.
inline constexpr std::string_view kShellWorker = R"SH(
read -r line <&3
id=$(printf '%s' "$line" | sed 's/.*"id":"\([^"]*\)".*/\1/')
path=$(printf '%s' "$line" | sed 's/.*"path":"\([^"]*\)".*/\1/')
reply() {
  printf '{"type":"result","id":"%s","result":%s,"memoryUsedBytes":2097152}\n' "$id" "$1" >&3
}
case "$1" in
  ok)
    echo "hello from worker"
    reply '{"statusCode":200,"headers":{"Content-Type":"text/plain","X-Worker":"sh"},"multiValueHeaders":{"Set-Cookie":["a=1","b=2"]},"body":"hello","isBase64Encoded":false}'
    exec sleep 30
    ;;
  path)
    reply "{\"statusCode\":201,\"headers\":{\"X-Path\":\"$path\"},\"body\":\"$path\",\"isBase64Encoded\":false}"
    exec sleep 30
    ;;
  env)
    reply "{\"statusCode\":200,\"headers\":{},\"body\":\"$NODE_CHANNEL_FD:$NODE_CHANNEL_SERIALIZATION_MODE:${HOME:-unset}\",\"isBase64Encoded\":false}"
    exec sleep 30
    ;;
  context)
    user=$(printf '%s' "$line" | sed 's/.*"user":"\([^"]*\)".*/\1/')
    reply "{\"statusCode\":200,\"headers\":{},\"body\":\"$user\",\"isBase64Encoded\":false}"
    exec sleep 30
    ;;
  base64)
    reply '{"statusCode":200,"headers":{"X-Binary":"yes"},"body":"aGVsbG8=","isBase64Encoded":true}'
    exec sleep 30
    ;;
  nomemory)
    printf '{"type":"result","id":"%s","result":{"statusCode":204,"headers":{},"body":"","isBase64Encoded":false}}\n' "$id" >&3
    exec sleep 30
    ;;
  crash)
    echo "boom" >&2
    exit 1
    ;;
  exit0)
    exit 0
    ;;
  wrongid)
    printf '{"type":"result","id":"someone-else","result":{"statusCode":200,"headers":{},"body":"","isBase64Encoded":false}}\n' >&3
    exec sleep 30
    ;;
  badshape)
    reply '{"statusCode":"200","headers":{},"body":"","isBase64Encoded":false}'
    exec sleep 30
    ;;
  inject)
    reply '{"statusCode":302,"headers":{"Location":"/next\r\nSet-Cookie: session=stolen"},"body":"","isBase64Encoded":false}'
    exec sleep 30
    ;;
  notjson)
    echo 'this is not json' >&3
    exec sleep 30
    ;;
  hang)
    echo "waiting"
    exec sleep 30
    ;;
esac
exit 3
)SH";

/// Fresh directory under the system temp dir
inline std::string make_temp_dir(std::string_view prefix) {
    static std::atomic<int> counter{0};
    auto dir = std::filesystem::temp_directory_path() /
               (std::string(prefix) + "_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(dir);
    return dir.string();
}

/// Runtime settings running kShellWorker under /bin/sh
inline runtime::RuntimeSettings shell_settings() {
    std::error_code ec;
    runtime::RuntimeSettings settings;
    settings.bin = "/bin/sh";
    settings.bootstrap_path =
        runtime::materialize_bootstrap(make_temp_dir("lamina_worker"), kShellWorker, ec);
    settings.env = {{"PATH", "/usr/bin:/bin"}};
    return settings;
}

/// Sink recording everything written to it (safe to read from another thread)
class CaptureSink : public runtime::LogSink {
public:
    void write(std::string_view text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        text_.append(text);
    }

    std::string text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return text_;
    }

    bool contains(std::string_view needle) const { return text().find(needle) != std::string::npos; }

private:
    mutable std::mutex mutex_;
    std::string text_;
};

/// Drive the loop until done() or the deadline; returns done()
inline bool run_until(core::EventLoop& loop, const std::function<bool()>& done,
                      std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        if (loop.run_once(20)) {
            return false;
        }
    }
    return true;
}

/// Blocking client socket connected to 127.0.0.1:port (-1 on failure)
inline int connect_local(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return -1;
    }

    timeval tv{};
    tv.tv_sec = 10;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

inline bool send_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

/// Parsed client-side view of one response
struct ClientResponse {
    int status = 0;
    std::string head;  // Status line and headers
    std::string body;

    /// First value of a header (case-sensitive name match on the wire spelling)
    std::optional<std::string> header(std::string_view name) const {
        std::string needle = "\r\n" + std::string(name) + ": ";
        size_t pos = head.find(needle);
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        pos += needle.size();
        return head.substr(pos, head.find("\r\n", pos) - pos);
    }

    size_t header_count(std::string_view name) const {
        std::string needle = "\r\n" + std::string(name) + ": ";
        size_t count = 0;
        for (size_t pos = head.find(needle); pos != std::string::npos;
             pos = head.find(needle, pos + 1)) {
            ++count;
        }
        return count;
    }
};

/// Read exactly one response (framed by Content-Length) from fd.
/// Bytes past it stay in carry for the next call.
inline std::optional<ClientResponse> read_response(int fd, std::string& carry) {
    auto fill = [&]() {
        char buffer[4096];
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return false;
        }
        carry.append(buffer, static_cast<size_t>(n));
        return true;
    };

    size_t head_end;
    while ((head_end = carry.find("\r\n\r\n")) == std::string::npos) {
        if (!fill()) {
            return std::nullopt;
        }
    }

    ClientResponse response;
    response.head = carry.substr(0, head_end + 2);
    response.status = std::stoi(response.head.substr(9, 3));

    size_t length = 0;
    if (auto value = response.header("Content-Length")) {
        length = std::stoul(*value);
    }

    size_t body_start = head_end + 4;
    while (carry.size() < body_start + length) {
        if (!fill()) {
            return std::nullopt;
        }
    }

    response.body = carry.substr(body_start, length);
    carry.erase(0, body_start + length);
    return response;
}

/// One request on a fresh connection
inline std::optional<ClientResponse> http_request(uint16_t port, std::string_view raw) {
    int fd = connect_local(port);
    if (fd < 0) {
        return std::nullopt;
    }
    std::optional<ClientResponse> response;
    if (send_all(fd, raw)) {
        std::string carry;
        response = read_response(fd, carry);
    }
    ::close(fd);
    return response;
}

/// Self-signed localhost certificate and its key, PEM encoded
struct TestCertificate {
    std::string cert_pem;
    std::string key_pem;
};

inline std::string bio_text(BIO* bio) {
    char* data = nullptr;
    long size = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<size_t>(size));
}

inline std::optional<TestCertificate> make_self_signed_certificate() {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_RSA_gen(2048), EVP_PKEY_free);
    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), X509_free);
    if (!key || !cert) {
        return std::nullopt;
    }

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
        return std::nullopt;
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(BIO_new(BIO_s_mem()), BIO_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!cert_bio || !key_bio || PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1 ||
        PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr,
                                 nullptr) != 1) {
        return std::nullopt;
    }

    return TestCertificate{bio_text(cert_bio.get()), bio_text(key_bio.get())};
}

}  // namespace lamina::test
