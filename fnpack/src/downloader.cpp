#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {

// libcurl write callbacks
size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::ostream* out = static_cast<std::ostream*>(stream);
    size_t bytes = size * nmemb;
    out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    return out->good() ? bytes : 0;
}

size_t append_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    out->append(static_cast<char*>(ptr), bytes);
    return bytes;
}

// Transfer-info callback, drives the progress bar
int progress_callback([[maybe_unused]] void* clientp, curl_off_t dltotal, curl_off_t dlnow, [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
    if (dltotal <= 0) {
        return 0;
    }
    double percentage = static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0;
    log_progress(get_string("info.downloading"), percentage);
    return 0;
}

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle make_handle(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw RegistryError(string_format("error.download_failed", url) + ": curl_easy_init");
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "fnpack");
    return curl;
}

void perform(CURL* curl, const std::string& url) {
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        throw RegistryError(string_format("error.http_status", url, status));
    }
    if (res != CURLE_OK) {
        throw RegistryError(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
}

} // anonymous namespace

void download_file(const std::string& url, const fs::path& output_path, bool show_progress) {
    CurlHandle curl = make_handle(url);

    std::ofstream ofile(output_path, std::ios::binary);
    if (!ofile) {
        throw FnpackException(string_format("error.create_file_failed", output_path.string()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofile);

    if (show_progress && !get_quiet_mode()) {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    }

    try {
        perform(curl.get(), url);
    } catch (const RegistryError&) {
        ofile.close();
        std::error_code ec;
        fs::remove(output_path, ec); // Clean up failed download
        throw;
    }
    if (show_progress && !get_quiet_mode() && isatty(STDOUT_FILENO)) {
        std::cout << std::endl;
    }
}

std::string http_get(const std::string& url) {
    CurlHandle curl = make_handle(url);

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);

    perform(curl.get(), url);
    return body;
}
