#pragma once

/// \file http_client.hpp
/// \brief Minimal blocking HTTP/1.1 client used to fetch dataset archives.
///
/// The client opens one connection per request, sends a plain GET with
/// `Connection: close` and streams the response body into a caller supplied
/// stream. `https://` URLs are wrapped in an OpenSSL session on top of the
/// same socket. Only the parts of the protocol needed to download static
/// files are handled: Content-Length, chunked transfer encoding, bodies
/// terminated by connection close and a bounded number of redirects.

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <ostream>
#include <sstream>
#include <string>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "mnist/errors.hpp"
#include "mnist/net_utils.hpp"

namespace mnist {

/// Maximum number of redirects followed by @ref http_get.
constexpr std::size_t kMaxRedirects = 5;

/// Components of an absolute http or https URL.
struct Url {
    std::string scheme{};
    std::string host{};
    unsigned short port{0};
    std::string path{"/"};

    bool is_tls() const { return scheme == "https"; }

    std::string str() const {
        std::string out = scheme + "://" + host;
        if (port != (is_tls() ? 443 : 80))
            out += ":" + std::to_string(port);
        return out + path;
    }
};

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Split an absolute URL into scheme, host, port and path.
 *
 * Throws a transport LoadError for anything other than http or https or
 * when the host is missing.
 */
inline Url parse_url(const std::string& text) {
    auto sep = text.find("://");
    if (sep == std::string::npos)
        throw LoadError(ErrorKind::Transport, "invalid URL: " + text);
    Url url;
    url.scheme = to_lower(text.substr(0, sep));
    if (url.scheme != "http" && url.scheme != "https")
        throw LoadError(ErrorKind::Transport, "unsupported URL scheme: " + url.scheme);

    auto rest = text.substr(sep + 3);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    url.path = slash == std::string::npos ? "/" : rest.substr(slash);

    url.port = url.is_tls() ? 443 : 80;
    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(),
                         [](unsigned char c) { return std::isdigit(c); }))
            throw LoadError(ErrorKind::Transport, "invalid port in URL: " + text);
        unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535)
            throw LoadError(ErrorKind::Transport, "invalid port in URL: " + text);
        url.port = static_cast<unsigned short>(value);
    }
    if (authority.empty())
        throw LoadError(ErrorKind::Transport, "missing host in URL: " + text);
    url.host = authority;
    return url;
}

/// Resolve a Location header value against the URL that produced it.
inline Url resolve_location(const Url& base, const std::string& location) {
    if (location.find("://") != std::string::npos)
        return parse_url(location);
    Url out = base;
    if (!location.empty() && location[0] == '/') {
        out.path = location;
    } else {
        auto dir = base.path.rfind('/');
        out.path = base.path.substr(0, dir + 1) + location;
    }
    return out;
}

/**
 * @brief One TCP connection, optionally wrapped in TLS.
 *
 * Owns the socket and the OpenSSL objects and releases them on destruction.
 */
class HttpConnection {
  public:
    explicit HttpConnection(const Url& url) : fd_{net_connect(url.host, url.port)} {
        if (url.is_tls()) {
            try {
                start_tls(url.host);
            } catch (...) {
                close();
                throw;
            }
        }
    }

    ~HttpConnection() { close(); }

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    void write_all(const std::string& data) {
        if (ssl_) {
            std::size_t off = 0;
            while (off < data.size()) {
                int n = SSL_write(ssl_, data.data() + off, static_cast<int>(data.size() - off));
                if (n <= 0)
                    throw LoadError(ErrorKind::Transport, "TLS write failed: " + ssl_error());
                off += static_cast<std::size_t>(n);
            }
            return;
        }
        if (!net_write_all(fd_, data.data(), data.size()))
            throw LoadError(ErrorKind::Transport, "failed to send request");
    }

    /// Read up to @p len bytes. Returns 0 once the peer has closed the stream.
    std::size_t read(char* buf, std::size_t len) {
        if (ssl_) {
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0)
                return static_cast<std::size_t>(n);
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_ZERO_RETURN)
                return 0;
            if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)
                return 0;
            throw LoadError(ErrorKind::Transport, "TLS read failed: " + ssl_error());
        }
        ssize_t n;
        do {
            n = net_read(fd_, buf, len);
        } while (n < 0 && errno == EINTR);
        if (n < 0)
            throw LoadError(ErrorKind::Transport,
                            std::string("failed to receive response: ") + std::strerror(errno));
        return static_cast<std::size_t>(n);
    }

  private:
    socket_t fd_{invalid_socket};
    SSL_CTX* ctx_{nullptr};
    SSL* ssl_{nullptr};

    static std::string ssl_error() {
        unsigned long code = ERR_get_error();
        if (code == 0)
            return "unknown error";
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        return buf;
    }

    void start_tls(const std::string& host) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_)
            throw LoadError(ErrorKind::Transport, "failed to create TLS context: " + ssl_error());
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        // Many static file servers close without sending close_notify.
        SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
            throw LoadError(ErrorKind::Transport, "failed to load trust store: " + ssl_error());
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);

        ssl_ = SSL_new(ctx_);
        if (!ssl_)
            throw LoadError(ErrorKind::Transport, "failed to create TLS session: " + ssl_error());
        if (SSL_set_fd(ssl_, fd_) != 1)
            throw LoadError(ErrorKind::Transport, "failed to attach TLS session: " + ssl_error());
        SSL_set_tlsext_host_name(ssl_, host.c_str());
        if (SSL_set1_host(ssl_, host.c_str()) != 1)
            throw LoadError(ErrorKind::Transport, "failed to set TLS host name: " + ssl_error());
        if (SSL_connect(ssl_) != 1)
            throw LoadError(ErrorKind::Transport,
                            "TLS handshake with " + host + " failed: " + ssl_error());
    }

    void close() {
        // No close_notify is sent; the request already asked for Connection: close.
        if (ssl_) {
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
        if (fd_ != invalid_socket) {
            net_close(fd_);
            fd_ = invalid_socket;
        }
    }
};

/// Buffered line and block reader on top of an @ref HttpConnection.
class ResponseReader {
  public:
    explicit ResponseReader(HttpConnection& conn) : conn_{conn} {}

    /// Read one CRLF (or LF) terminated line without the terminator.
    /// Returns false when the stream ends before any byte is read.
    bool read_line(std::string& line) {
        line.clear();
        while (true) {
            if (pos_ == len_ && !fill())
                return !line.empty();
            char c = buf_[pos_++];
            if (c == '\n') {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                return true;
            }
            line.push_back(c);
        }
    }

    /// Copy up to @p max bytes into @p out. Returns the number copied, 0 at EOF.
    std::size_t read_some(std::ostream& out, std::size_t max) {
        if (pos_ == len_ && !fill())
            return 0;
        std::size_t n = std::min(max, len_ - pos_);
        out.write(buf_ + pos_, static_cast<std::streamsize>(n));
        pos_ += n;
        return n;
    }

  private:
    HttpConnection& conn_;
    char buf_[8192];
    std::size_t pos_{0};
    std::size_t len_{0};

    bool fill() {
        len_ = conn_.read(buf_, sizeof(buf_));
        pos_ = 0;
        return len_ > 0;
    }
};

/// Parsed status line and headers. Header names are stored lower case.
struct ResponseHead {
    int status{0};
    std::map<std::string, std::string> headers{};

    const std::string* header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? nullptr : &it->second;
    }
};

inline ResponseHead read_response_head(ResponseReader& reader) {
    ResponseHead head;
    std::string line;
    if (!reader.read_line(line))
        throw LoadError(ErrorKind::Transport, "empty HTTP response");
    std::istringstream status_line(line);
    std::string version;
    status_line >> version >> head.status;
    if (version.compare(0, 5, "HTTP/") != 0 || !status_line)
        throw LoadError(ErrorKind::Transport, "malformed HTTP status line: " + line);

    while (true) {
        if (!reader.read_line(line))
            throw LoadError(ErrorKind::Transport, "connection closed inside HTTP headers");
        if (line.empty())
            break;
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        std::string value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t");
        value = first == std::string::npos ? "" : value.substr(first, last - first + 1);
        head.headers[to_lower(line.substr(0, colon))] = value;
    }
    return head;
}

inline void copy_exact(ResponseReader& reader, std::ostream& body, std::size_t length) {
    std::size_t remaining = length;
    while (remaining > 0) {
        std::size_t n = reader.read_some(body, remaining);
        if (n == 0)
            throw LoadError(ErrorKind::Transport,
                            "connection closed after " + std::to_string(length - remaining) +
                                " of " + std::to_string(length) + " body bytes");
        remaining -= n;
    }
}

inline void read_chunked_body(ResponseReader& reader, std::ostream& body) {
    std::string line;
    while (true) {
        if (!reader.read_line(line))
            throw LoadError(ErrorKind::Transport, "connection closed inside chunked body");
        std::size_t size = 0;
        try {
            size = std::stoul(line.substr(0, line.find(';')), nullptr, 16);
        } catch (const std::exception&) {
            throw LoadError(ErrorKind::Transport, "invalid chunk size: " + line);
        }
        if (size == 0)
            break;
        copy_exact(reader, body, size);
        if (!reader.read_line(line) || !line.empty())
            throw LoadError(ErrorKind::Transport, "missing CRLF after chunk");
    }
    // Trailer section ends with an empty line.
    while (reader.read_line(line) && !line.empty()) {
    }
}

inline void read_body(ResponseReader& reader, const ResponseHead& head, std::ostream& body) {
    const std::string* encoding = head.header("transfer-encoding");
    if (encoding && to_lower(*encoding).find("chunked") != std::string::npos) {
        read_chunked_body(reader, body);
    } else if (const std::string* length = head.header("content-length")) {
        std::size_t expected = 0;
        try {
            expected = std::stoull(*length);
        } catch (const std::exception&) {
            throw LoadError(ErrorKind::Transport, "invalid Content-Length: " + *length);
        }
        copy_exact(reader, body, expected);
    } else {
        while (reader.read_some(body, static_cast<std::size_t>(-1)) > 0) {
        }
    }
    if (!body)
        throw LoadError(ErrorKind::Filesystem, "failed to write response body");
}

inline bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

/**
 * @brief Perform a blocking GET and stream the body into @p body.
 *
 * Redirects are followed up to @p max_redirects times. The final status
 * code is returned; the body is only written when it is 200.
 */
inline int http_get(const std::string& url, std::ostream& body,
                    std::size_t max_redirects = kMaxRedirects) {
    Url target = parse_url(url);
    for (std::size_t hop = 0;; ++hop) {
        HttpConnection conn(target);
        std::string req = "GET " + target.path + " HTTP/1.1\r\n";
        req += "Host: " + target.host;
        if (target.port != (target.is_tls() ? 443 : 80))
            req += ":" + std::to_string(target.port);
        req += "\r\n";
        req += "User-Agent: mnist_reader\r\n";
        req += "Accept: */*\r\n";
        req += "Connection: close\r\n\r\n";
        conn.write_all(req);

        ResponseReader reader(conn);
        ResponseHead head = read_response_head(reader);
        if (is_redirect(head.status)) {
            const std::string* location = head.header("location");
            if (!location)
                return head.status;
            if (hop >= max_redirects)
                throw LoadError(ErrorKind::Transport, "too many redirects fetching " + url);
            target = resolve_location(target, *location);
            continue;
        }
        if (head.status != 200)
            return head.status;
        read_body(reader, head, body);
        return head.status;
    }
}

} // namespace mnist
