#include "http/syntax.hpp"

namespace http
{

const std::string HttpSyntax::kCrlf = "\r\n";
const std::string HttpSyntax::kHttpVersionPrefix = "HTTP/";
const std::string HttpSyntax::kStatusLinePrefix = "HTTP";
const std::string HttpSyntax::kOWS = "\t ";  // Optional White Space
const std::string HttpSyntax::kWhitespace = " \t\r\n\v\f";

}  // namespace http
