/** \file   S3BridgeStore.cc
 *  \brief  Implementation of class S3BridgeStore.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "S3BridgeStore.h"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <cctype>
#include <cstring>
#include <unistd.h>
#include "ChunkCodec.h"
#include "DumpBridgeErrors.h"
#include "StringUtil.h"
#include "XMLParser.h"
#include "util.h"


namespace {


int GlobalInit() {
    if (unlikely(::curl_global_init(CURL_GLOBAL_ALL) != 0)) {
        const std::string error_message("curl_global_init(3) failed!\n");
        const ssize_t dummy(::write(STDERR_FILENO, error_message.c_str(), error_message.length()));
        (void)dummy;
        ::_exit(EXIT_FAILURE);
    }

    return 0;
}


int dummy(GlobalInit());


enum Operation { PUT, GET, LIST, HEAD };


// Maps a failed request to the error taxonomy.  "curl_error" is CURLE_OK if we got an HTTP response.
[[noreturn]] void ThrowRequestError(const Operation operation, const std::string &what, const CURLcode curl_error,
                                    const long response_code, const std::string &response_body)
{
    if (curl_error != CURLE_OK) {
        const std::string message(what + " failed: " + std::string(::curl_easy_strerror(curl_error)));
        if (operation == PUT)
            throw DumpBridge::UploadError(message);
        if (operation == GET)
            throw DumpBridge::DownloadError(message);
        throw DumpBridge::ConnectionError(message, /* transient = */true);
    }

    const std::string message(what + " failed with HTTP status " + std::to_string(response_code)
                              + (response_body.empty() ? std::string("") : ": " + response_body.substr(0, 512)));
    if (response_code == 401 or response_code == 403)
        throw DumpBridge::ConnectionError(message);

    const bool transient(response_code >= 500 or response_code == 429 or response_code == 408);
    if (operation == PUT)
        throw DumpBridge::UploadError(message, transient);
    if (operation == GET or operation == LIST)
        throw DumpBridge::DownloadError(message, transient);
    throw DumpBridge::ConnectionError(message, transient);
}


class UploadBuffer {
    const std::string &data_;
    size_t offset_;
public:
    explicit UploadBuffer(const std::string &data): data_(data), offset_(0) { }
    size_t read(char * const buffer, const size_t size);
};


inline size_t UploadBuffer::read(char * const buffer, const size_t size) {
    const size_t actual(std::min(size, data_.size() - offset_));
    std::memcpy(buffer, data_.data() + offset_, actual);
    offset_ += actual;

    return actual;
}


size_t UploadCallback(char *buffer, size_t size, size_t nitems, void *instream) {
    UploadBuffer * const upload_buffer(reinterpret_cast<UploadBuffer *>(instream));
    return upload_buffer->read(buffer, size * nitems);
}


/** \class  Request
 *  \brief  One signed HTTP request against the object store.  Owns the easy handle and the header list.
 *  \note   If a cancellation token is given, the transfer is aborted within about a second of its cancellation.
 */
class Request {
    CURL *easy_handle_;
    curl_slist *http_headers_;
    char error_buffer_[CURL_ERROR_SIZE];
    std::shared_ptr<ThreadUtil::CancellationToken> cancellation_token_;
    BridgeStore::DataConsumer consumer_; // Receives the body of successful responses.
    std::string error_body_;             // The body of unsuccessful responses.
    std::exception_ptr consumer_exception_;
public:
    Request(const S3BridgeStore::Params &params, const std::string &url,
            const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token);
    Request(const Request &rhs) = delete;
    ~Request();

    void addHeader(const std::string &header);
    void setUpload(UploadBuffer * const upload_buffer, const size_t upload_size, const std::string &payload_checksum);
    void setHeadOnly();
    void setConsumer(const BridgeStore::DataConsumer &consumer) { consumer_ = consumer; }

    /** \brief  Performs the request.
     *  \param  response_code  Set to the HTTP status if we got a response, o/w left alone.
     *  \return The libcurl result.
     *  \note   Rethrows anything that the consumer threw.
     *  \throws DumpBridge::CancelledError if the cancellation token was cancelled before or during the transfer.
     */
    CURLcode perform(long * const response_code);

    const std::string &getErrorBody() const { return error_body_; }
private:
    template <typename OptionType> void curlEasySetopt(const CURLoption option, OptionType value, const std::string &caller_info) {
        if (unlikely(::curl_easy_setopt(easy_handle_, option, value) != CURLE_OK))
            throw std::runtime_error("in S3BridgeStore Request: curl_easy_setopt(" + caller_info + ") failed!");
    }
    size_t writeFunction(void *data, size_t size, size_t nmemb);
    static size_t WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    static int XferInfoFunction(void *this_pointer, curl_off_t download_total, curl_off_t downloaded, curl_off_t upload_total,
                                curl_off_t uploaded);
};


Request::Request(const S3BridgeStore::Params &params, const std::string &url,
                 const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
    : http_headers_(nullptr), cancellation_token_(cancellation_token)
{
    easy_handle_ = ::curl_easy_init();
    if (unlikely(easy_handle_ == nullptr))
        throw DumpBridge::ConnectionError("curl_easy_init() failed!", /* transient = */true);

    error_buffer_[0] = '\0';
    const std::string user_and_password(params.access_key_id_ + ":" + params.secret_access_key_);
    const std::string sigv4_provider("aws:amz:" + params.region_ + ":s3");
    curlEasySetopt(CURLOPT_URL, url.c_str(), "CURLOPT_URL");
    curlEasySetopt(CURLOPT_AWS_SIGV4, sigv4_provider.c_str(), "CURLOPT_AWS_SIGV4");
    curlEasySetopt(CURLOPT_USERPWD, user_and_password.c_str(), "CURLOPT_USERPWD");
    curlEasySetopt(CURLOPT_NOSIGNAL, 1L, "CURLOPT_NOSIGNAL");
    if (cancellation_token_ == nullptr)
        curlEasySetopt(CURLOPT_NOPROGRESS, 1L, "CURLOPT_NOPROGRESS");
    else {
        // libcurl calls this at least once per second, even while a transfer is stalled.
        curlEasySetopt(CURLOPT_NOPROGRESS, 0L, "CURLOPT_NOPROGRESS");
        curlEasySetopt(CURLOPT_XFERINFOFUNCTION, XferInfoFunction, "CURLOPT_XFERINFOFUNCTION");
        curlEasySetopt(CURLOPT_XFERINFODATA, reinterpret_cast<void *>(this), "CURLOPT_XFERINFODATA");
    }
    curlEasySetopt(CURLOPT_ERRORBUFFER, error_buffer_, "CURLOPT_ERRORBUFFER");
    curlEasySetopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(params.connect_timeout_), "CURLOPT_CONNECTTIMEOUT_MS");
    curlEasySetopt(CURLOPT_LOW_SPEED_LIMIT, 1L, "CURLOPT_LOW_SPEED_LIMIT");
    curlEasySetopt(CURLOPT_LOW_SPEED_TIME, static_cast<long>(params.stall_timeout_), "CURLOPT_LOW_SPEED_TIME");
    curlEasySetopt(CURLOPT_WRITEFUNCTION, WriteFunction, "CURLOPT_WRITEFUNCTION");
    curlEasySetopt(CURLOPT_WRITEDATA, reinterpret_cast<void *>(this), "CURLOPT_WRITEDATA");
}


Request::~Request() {
    ::curl_easy_cleanup(easy_handle_);
    if (http_headers_ != nullptr)
        ::curl_slist_free_all(http_headers_);
}


void Request::addHeader(const std::string &header) {
    curl_slist * const new_headers(::curl_slist_append(http_headers_, header.c_str()));
    if (unlikely(new_headers == nullptr))
        throw std::runtime_error("in S3BridgeStore Request::addHeader: curl_slist_append() failed!");
    http_headers_ = new_headers;
}


void Request::setUpload(UploadBuffer * const upload_buffer, const size_t upload_size, const std::string &payload_checksum) {
    curlEasySetopt(CURLOPT_UPLOAD, 1L, "CURLOPT_UPLOAD");
    curlEasySetopt(CURLOPT_READFUNCTION, UploadCallback, "CURLOPT_READFUNCTION");
    curlEasySetopt(CURLOPT_READDATA, reinterpret_cast<void *>(upload_buffer), "CURLOPT_READDATA");
    curlEasySetopt(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(upload_size), "CURLOPT_INFILESIZE_LARGE");

    // SigV4 needs the payload hash, libcurl can't compute it for streamed uploads:
    addHeader("x-amz-content-sha256: " + payload_checksum);
    addHeader("Content-Type: application/octet-stream");
    addHeader("Expect:");
}


void Request::setHeadOnly() {
    curlEasySetopt(CURLOPT_NOBODY, 1L, "CURLOPT_NOBODY");
}


CURLcode Request::perform(long * const response_code) {
    if (http_headers_ != nullptr)
        curlEasySetopt(CURLOPT_HTTPHEADER, http_headers_, "CURLOPT_HTTPHEADER");

    DumpBridge::ThrowIfCancelled(cancellation_token_);
    const CURLcode curl_error(::curl_easy_perform(easy_handle_));
    if (consumer_exception_ != nullptr)
        std::rethrow_exception(consumer_exception_);
    if (curl_error == CURLE_ABORTED_BY_CALLBACK)
        DumpBridge::ThrowIfCancelled(cancellation_token_);
    if (curl_error != CURLE_OK)
        return curl_error;

    ::curl_easy_getinfo(easy_handle_, CURLINFO_RESPONSE_CODE, response_code);
    return CURLE_OK;
}


size_t Request::writeFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);

    long response_code(0);
    ::curl_easy_getinfo(easy_handle_, CURLINFO_RESPONSE_CODE, &response_code);
    if (response_code < 200 or response_code >= 300 or not consumer_) {
        error_body_.append(reinterpret_cast<char *>(data), total_size);
        return total_size;
    }

    try {
        consumer_(reinterpret_cast<char *>(data), total_size);
    } catch (...) {
        // Must not unwind through libcurl, perform() rethrows.
        consumer_exception_ = std::current_exception();
        return 0;
    }

    return total_size;
}


size_t Request::WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    return reinterpret_cast<Request *>(this_pointer)->writeFunction(data, size, nmemb);
}


// A non-zero return value makes libcurl abort the transfer w/ CURLE_ABORTED_BY_CALLBACK.
int Request::XferInfoFunction(void *this_pointer, curl_off_t /*download_total*/, curl_off_t /*downloaded*/, curl_off_t /*upload_total*/,
                              curl_off_t /*uploaded*/)
{
    const Request * const request(reinterpret_cast<Request *>(this_pointer));
    return request->cancellation_token_->isCancelled() ? 1 : 0;
}


// Percent-encodes everything except unreserved characters and, if "keep_slashes" is true, slashes.
std::string UriEncode(const std::string &s, const bool keep_slashes) {
    static const char HEX_DIGITS[] = "0123456789ABCDEF";

    std::string encoded;
    for (const unsigned char ch : s) {
        if (std::isalnum(ch) or ch == '-' or ch == '_' or ch == '.' or ch == '~' or (keep_slashes and ch == '/'))
            encoded += static_cast<char>(ch);
        else {
            encoded += '%';
            encoded += HEX_DIGITS[ch >> 4u];
            encoded += HEX_DIGITS[ch & 0xFu];
        }
    }

    return encoded;
}


} // unnamed namespace


S3BridgeStore::Params::Params(const IniFile::Section &section)
    : bucket_(section.getString("bucket")), region_(section.getString("region", "us-east-1")),
      endpoint_(section.getString("endpoint", "")), access_key_id_(section.getString("access_key_id")),
      secret_access_key_(section.getString("secret_access_key")),
      connect_timeout_(section.getUnsigned("connect_timeout", DEFAULT_CONNECT_TIMEOUT)),
      stall_timeout_(section.getUnsigned("stall_timeout", DEFAULT_STALL_TIMEOUT))
{
    if (endpoint_.empty())
        endpoint_ = "https://s3." + region_ + ".amazonaws.com";
    while (not endpoint_.empty() and endpoint_.back() == '/')
        endpoint_.pop_back();
}


S3BridgeStore::S3BridgeStore(const Params &params): params_(params) {
    if (unlikely(params_.bucket_.empty()))
        throw DumpBridge::ConfigurationError("S3 bridge store needs a bucket!");
    if (unlikely(not StringUtil::StartsWith(params_.endpoint_, "http://") and not StringUtil::StartsWith(params_.endpoint_, "https://")))
        throw DumpBridge::ConfigurationError("S3 endpoint must start with http:// or https://! (got \"" + params_.endpoint_ + "\")");
}


std::string S3BridgeStore::getObjectUrl(const std::string &key) const {
    return params_.endpoint_ + "/" + UriEncode(params_.bucket_, false) + "/" + UriEncode(key, /* keep_slashes = */true);
}


void S3BridgeStore::put(const std::string &key, const std::string &data,
                        const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    ValidateKey(key);

    Request request(params_, getObjectUrl(key), cancellation_token);
    UploadBuffer upload_buffer(data);
    request.setUpload(&upload_buffer, data.size(), ChunkCodec::Checksum(data));

    long response_code(0);
    const CURLcode curl_error(request.perform(&response_code));
    if (curl_error != CURLE_OK or response_code < 200 or response_code >= 300)
        ThrowRequestError(PUT, "PUT of \"" + key + "\"", curl_error, response_code, request.getErrorBody());

    LOG_DEBUG("stored " + std::to_string(data.size()) + " bytes under \"" + key + "\"");
}


void S3BridgeStore::get(const std::string &key, const DataConsumer &consumer,
                        const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    ValidateKey(key);

    Request request(params_, getObjectUrl(key), cancellation_token);
    request.addHeader("x-amz-content-sha256: UNSIGNED-PAYLOAD");
    request.setConsumer(consumer);

    long response_code(0);
    const CURLcode curl_error(request.perform(&response_code));
    if (curl_error == CURLE_OK and response_code == 404)
        throw DumpBridge::DownloadError("no such object: \"" + key + "\"!", /* transient = */false);
    if (curl_error != CURLE_OK or response_code < 200 or response_code >= 300)
        ThrowRequestError(GET, "GET of \"" + key + "\"", curl_error, response_code, request.getErrorBody());
}


std::vector<std::string> S3BridgeStore::list(const std::string &prefix,
                                             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    std::vector<std::string> keys;
    std::string continuation_token;
    do {
        std::string url(params_.endpoint_ + "/" + UriEncode(params_.bucket_, false) + "?list-type=2&prefix=" + UriEncode(prefix, false));
        if (not continuation_token.empty())
            url += "&continuation-token=" + UriEncode(continuation_token, false);

        std::string response;
        Request request(params_, url, cancellation_token);
        request.addHeader("x-amz-content-sha256: UNSIGNED-PAYLOAD");
        request.setConsumer([&response](const char * const data, const size_t data_size) { response.append(data, data_size); });

        long response_code(0);
        const CURLcode curl_error(request.perform(&response_code));
        if (curl_error != CURLE_OK or response_code != 200)
            ThrowRequestError(LIST, "listing of prefix \"" + prefix + "\"", curl_error, response_code, request.getErrorBody());

        std::vector<std::string> page_keys;
        if (unlikely(not ParseListResponse(response, &page_keys, &continuation_token)))
            throw DumpBridge::DownloadError("unexpected response to a listing of prefix \"" + prefix + "\"!", /* transient = */false);
        keys.insert(keys.end(), page_keys.cbegin(), page_keys.cend());
    } while (not continuation_token.empty());

    std::sort(keys.begin(), keys.end());
    return keys;
}


bool S3BridgeStore::exists(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    ValidateKey(key);

    Request request(params_, getObjectUrl(key), cancellation_token);
    request.addHeader("x-amz-content-sha256: UNSIGNED-PAYLOAD");
    request.setHeadOnly();

    long response_code(0);
    const CURLcode curl_error(request.perform(&response_code));
    if (curl_error == CURLE_OK and response_code == 200)
        return true;
    if (curl_error == CURLE_OK and response_code == 404)
        return false;
    ThrowRequestError(HEAD, "HEAD of \"" + key + "\"", curl_error, response_code, request.getErrorBody());
}


bool S3BridgeStore::ParseListResponse(const std::string &response, std::vector<std::string> * const keys,
                                      std::string * const continuation_token)
{
    keys->clear();
    continuation_token->clear();

    bool is_truncated(false);
    unsigned keys_in_current_contents(0);
    try {
        // Keep whitespace, keys may legitimately start or end w/ blanks.
        XMLParser xml_parser(response, "ListObjectsV2 response", XMLParser::Options{ /* ignore_whitespace_ = */ false });
        std::vector<std::string> open_elements; // Local names, outermost first.
        std::string text;
        XMLParser::XMLPart xml_part;
        while (xml_parser.getNext(&xml_part)) {
            if (xml_part.isOpeningTag()) {
                if (open_elements.empty() and xml_part.getLocalName() != "ListBucketResult")
                    return false;
                open_elements.emplace_back(xml_part.getLocalName());
                if (open_elements.size() == 2 and open_elements[1] == "Contents")
                    keys_in_current_contents = 0;
                text.clear();
            } else if (xml_part.isCharacters())
                text += xml_part.data_;
            else if (xml_part.isClosingTag() and not open_elements.empty()) {
                if (open_elements.size() == 3 and open_elements[1] == "Contents" and open_elements[2] == "Key") {
                    keys->emplace_back(text);
                    ++keys_in_current_contents;
                } else if (open_elements.size() == 2 and open_elements[1] == "Contents") {
                    if (unlikely(keys_in_current_contents != 1))
                        return false;
                } else if (open_elements.size() == 2 and open_elements[1] == "IsTruncated")
                    is_truncated = (StringUtil::Trim(text) == "true");
                else if (open_elements.size() == 2 and open_elements[1] == "NextContinuationToken")
                    *continuation_token = StringUtil::Trim(text);
                open_elements.pop_back();
                text.clear();
            }
        }
    } catch (const XMLParser::Error &x) {
        LOG_WARNING("malformed ListObjectsV2 response: " + std::string(x.what()));
        return false;
    }

    if (not is_truncated)
        continuation_token->clear();
    else if (unlikely(continuation_token->empty()))
        return false;

    return true;
}
