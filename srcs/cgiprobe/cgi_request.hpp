#ifndef CGIPROBE_CGI_REQUEST_HPP_
#define CGIPROBE_CGI_REQUEST_HPP_

#include <string>

#include "http/content_types.hpp"
#include "http/form_fields.hpp"
#include "http/http_method.hpp"
#include "utils/data_type.hpp"

namespace cgiprobe
{

// 1回の get()/post() 呼び出しの内容（バックエンド共通）
struct CgiRequest
{
    http::HttpMethod method;
    http::FormFields query;    // GET
    utils::ByteVector body;    // POST（エンコード済み）
    std::string content_type;  // POST

    CgiRequest() : method(), query(), body(), content_type() {}

    static CgiRequest get(const http::FormFields& query)
    {
        CgiRequest r;
        r.method = http::HttpMethod::GET;
        r.query = query;
        return r;
    }

    static CgiRequest post(const utils::ByteVector& data, const std::string& mime)
    {
        CgiRequest r;
        r.method = http::HttpMethod::POST;
        r.body = data;
        r.content_type = mime;
        return r;
    }

    // フォームは常に application/x-www-form-urlencoded で送る
    static CgiRequest post(const http::FormFields& data)
    {
        return post(utils::toBytes(data.encode()),
            http::ContentType(http::ContentType::APPLICATION_X_WWW_FORM_URLENCODED)
                .toString());
    }
};

}  // namespace cgiprobe

#endif
