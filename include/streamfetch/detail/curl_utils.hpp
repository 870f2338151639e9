#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace streamfetch::detail {

using CurlEasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlMultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// Runs curl_global_init exactly once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

// "Name: value" line for CURLOPT_HTTPHEADER ("Name;" sends an empty value).
std::string formatHeaderLine(const std::string& name, const std::string& value);

// Prefers the handle's error buffer over the generic code description.
std::string describeCurlError(CURLcode code, const char* error_buffer);

} // namespace streamfetch::detail
