#include <boost/url.hpp>
#include <core/util/request_target.h>

namespace urls = boost::urls;

namespace filerelay::core {

std::optional<RequestTarget> ParseRequestTarget(std::string_view target) {
    auto parsed = urls::parse_origin_form(target);
    if (parsed.has_error()) {
        return std::nullopt;
    }

    RequestTarget result;
    result.path = parsed->path();
    for (auto param : parsed->params(urls::encoding_opts(true))) {
        if (param.key.empty()) {
            continue;
        }
        result.params.insert_or_assign(std::move(param.key), std::move(param.value));
    }
    return result;
}

std::optional<std::string> PercentDecode(std::string_view encoded) {
    auto escaped = urls::make_pct_string_view(encoded);
    if (escaped.has_error()) {
        return std::nullopt;
    }
    auto decoded = escaped->decode();
    return std::string(decoded.begin(), decoded.end());
}

} // namespace filerelay::core
