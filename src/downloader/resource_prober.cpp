/*
 * parafetch/src/downloader/resource_prober.cpp
 *
 * Resource discovery:
 * - HEAD with manual, bounded redirect resolution (absolute, /-rooted and path-relative
 *   Location values)
 * - GET bytes=0-0 against the final URL when HEAD is not 2xx or reports neither
 *   Content-Length nor Accept-Ranges; HEAD headers fill in whatever the GET lacks
 * - Transport failures are fatal and not retried
 */

#include <parafetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>

namespace parafetch::downloader {

namespace {

struct UrlParts {
    std::string_view scheme;
    std::string_view authority;
    std::string_view path; // without query/fragment
};

UrlParts splitUrl(std::string_view url) {
    UrlParts parts;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos) {
        parts.path = url;
        return parts;
    }
    parts.scheme = url.substr(0, schemeEnd);
    auto rest = url.substr(schemeEnd + 3);
    auto authEnd = rest.find_first_of("/?#");
    parts.authority = rest.substr(0, authEnd);
    if (authEnd == std::string_view::npos)
        return parts;
    auto afterAuth = rest.substr(authEnd);
    parts.path = afterAuth.substr(0, afterAuth.find_first_of("?#"));
    return parts;
}

std::optional<std::uint64_t> parseDigits(std::string_view s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    std::uint64_t v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc())
        return std::nullopt;
    return v;
}

// "bytes 0-0/12345" -> 12345
std::optional<std::uint64_t> totalFromContentRange(std::string_view value) {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    return parseDigits(value.substr(slash + 1));
}

bool isSuccess(long status) {
    return status >= 200 && status < 300;
}

std::string lowerCopy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string resolveRedirect(std::string_view currentUrl, std::string_view location) {
    if (location.find("://") != std::string_view::npos)
        return std::string(location);

    auto base = splitUrl(currentUrl);
    std::string out;
    out.append(base.scheme);
    out.append("://");
    out.append(base.authority);

    if (!location.empty() && location.front() == '/') {
        out.append(location);
        return out;
    }

    // Path-relative: resolve against the directory of the current path
    std::string_view dir;
    auto slash = base.path.rfind('/');
    if (slash != std::string_view::npos)
        dir = base.path.substr(0, slash);
    out.append(dir);
    out.push_back('/');
    out.append(location);
    return out;
}

Expected<RemoteResource> probeResource(IHttpTransport& http, std::string_view url,
                                       const TransferOptions& opts, int maxRedirects) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "probe: empty URL"};
    }

    const auto headers = defaultRequestHeaders(opts);
    std::string current(url);
    HttpResponse last;

    const int hops = std::max(0, maxRedirects);
    for (int hop = 0; hop <= hops; ++hop) {
        auto r = http.head(current, headers, opts);
        if (!r.ok()) {
            return Error{ErrorCode::ProbeFailed,
                         "Probe failed for " + current + ": " + r.error().message};
        }
        last = std::move(r).value();

        if (!isRedirectStatus(last.status))
            break;

        auto location = last.header("location");
        if (!location || location->empty()) {
            spdlog::debug("Redirect {} from {} without Location; treating as final", last.status,
                          current);
            break;
        }
        if (hop == hops) {
            spdlog::warn("Redirect limit ({}) reached at {}", hops, current);
            break;
        }
        auto next = resolveRedirect(current, *location);
        spdlog::debug("Redirect {} {} -> {}", last.status, current, next);
        current = std::move(next);
    }

    std::vector<Header> merged = last.headers;
    std::optional<std::uint64_t> rangeTotal;
    bool partialReply = false;
    const bool headUsable = isSuccess(last.status) &&
                            (last.header("content-length") || last.header("accept-ranges"));

    if (!headUsable) {
        spdlog::debug("HEAD {} -> {}; probing with GET bytes=0-0", current, last.status);
        auto rangeHeaders = headers;
        rangeHeaders.push_back({"Range", "bytes=0-0"});
        auto g = http.get(current, rangeHeaders, opts, BodySink{}, ShouldCancel{},
                          ResponseHeadCheck{});
        if (!g.ok()) {
            return Error{ErrorCode::ProbeFailed,
                         "Probe failed for " + current + ": " + g.error().message};
        }
        const auto& resp = g.value();
        merged = resp.headers;
        for (const auto& h : last.headers) {
            auto exists = std::any_of(merged.begin(), merged.end(),
                                      [&](const Header& m) { return m.name == h.name; });
            if (!exists)
                merged.push_back(h);
        }
        if (resp.status == 206) {
            partialReply = true;
            if (auto cr = resp.header("content-range"))
                rangeTotal = totalFromContentRange(*cr);
        }
    }

    HttpResponse view;
    view.headers = std::move(merged);

    RemoteResource out;
    out.finalUrl = current;
    out.acceptsRanges = lowerCopy(view.header("accept-ranges").value_or("")) == "bytes";
    if (rangeTotal) {
        out.sizeBytes = rangeTotal;
    } else if (auto cl = view.header("content-length"); cl && !partialReply) {
        // Content-Length of a 206 is the length of the 0-0 slice
        out.sizeBytes = parseDigits(*cl);
    }
    out.etag = view.header("etag");
    out.lastModified = view.header("last-modified");

    spdlog::debug("Probe {}: size={} ranges={}", out.finalUrl,
                  out.sizeBytes ? std::to_string(*out.sizeBytes) : std::string("unknown"),
                  out.acceptsRanges);
    if (out.etag) {
        spdlog::debug("HTTP probe captured ETag: {}", *out.etag);
    }
    if (out.lastModified) {
        spdlog::debug("HTTP probe captured Last-Modified: {}", *out.lastModified);
    }
    return out;
}

} // namespace parafetch::downloader
