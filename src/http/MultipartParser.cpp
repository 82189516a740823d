#include "http/MultipartParser.hpp"
#include "http/HeaderValue.hpp"
#include "core/Errors.hpp"
#include "config.hpp"

namespace dropzone {
namespace http {

MultipartParser::MultipartParser(const std::string& boundary, Callbacks callbacks)
    : delimiter_("\r\n--" + boundary), callbacks_(std::move(callbacks)) {
    if (boundary.empty() || boundary.size() > 200) {
        throw MalformedRequestError("Invalid multipart boundary");
    }
    // The first boundary may start the body without a preceding CRLF
    pending_ = "\r\n";
}

void MultipartParser::parseContentDisposition(const std::string& value,
                                              std::string& name,
                                              std::string& filename) {
    auto params = HeaderValue::parameters(value);

    auto it = params.find("name");
    if (it != params.end()) name = it->second;

    it = params.find("filename");
    if (it != params.end()) filename = it->second;

    // RFC 5987 form wins when present: filename*=UTF-8''na%C3%AFve.txt
    it = params.find("filename*");
    if (it != params.end()) {
        const std::string& ext = it->second;
        auto quote = ext.find("''");
        if (quote != std::string::npos) {
            std::string decoded;
            if (HeaderValue::percentDecode(ext.substr(quote + 2), decoded) && !decoded.empty()) {
                filename = decoded;
            }
        }
    }
}

void MultipartParser::parsePartHeaders(const std::string& block, MultipartPart& part) {
    size_t hpos = 0;
    while (hpos < block.size()) {
        size_t eol = block.find("\r\n", hpos);
        std::string hline = block.substr(hpos, (eol == std::string::npos ? block.size() : eol) - hpos);
        hpos = (eol == std::string::npos) ? block.size() : eol + 2;

        if (hline.empty()) continue;
        auto colon = hline.find(':');
        if (colon == std::string::npos) {
            throw MalformedRequestError("Invalid multipart part header");
        }

        std::string hname = hline.substr(0, colon);
        std::string hvalue = hline.substr(colon + 1);
        HeaderValue::trim(hname);
        HeaderValue::trim(hvalue);
        HeaderValue::toLower(hname);

        if (hname == "content-disposition") {
            parseContentDisposition(hvalue, part.name, part.filename);
        } else if (hname == "content-type") {
            part.content_type = hvalue;
        }
    }
}

std::string MultipartParser::extractBoundary(const std::string& content_type) {
    auto params = HeaderValue::parameters(content_type);
    auto it = params.find("boundary");
    return it != params.end() ? it->second : std::string();
}

void MultipartParser::feed(const char* data, size_t size) {
    if (state_ == State::Done) return;  // epilogue is ignored
    pending_.append(data, size);
    process();
}

void MultipartParser::finish() {
    if (state_ != State::Done) {
        throw MalformedRequestError("Multipart body ended before the closing boundary");
    }
}

void MultipartParser::process() {
    bool progressed = true;
    while (progressed && state_ != State::Done) {
        switch (state_) {
            case State::Preamble:      progressed = processPreamble(); break;
            case State::AfterBoundary: progressed = processAfterBoundary(); break;
            case State::Headers:       progressed = processHeaders(); break;
            case State::Body:          progressed = processBody(); break;
            case State::Done:          progressed = false; break;
        }
    }
    if (state_ == State::Done) pending_.clear();
}

bool MultipartParser::processPreamble() {
    size_t pos = pending_.find(delimiter_);
    if (pos == std::string::npos) {
        // Keep a tail that could be the start of a split delimiter
        if (pending_.size() >= delimiter_.size()) {
            pending_.erase(0, pending_.size() - (delimiter_.size() - 1));
        }
        return false;
    }
    pending_.erase(0, pos + delimiter_.size());
    state_ = State::AfterBoundary;
    return true;
}

bool MultipartParser::processAfterBoundary() {
    // Skip transport padding after the boundary
    size_t i = 0;
    while (i < pending_.size() && (pending_[i] == ' ' || pending_[i] == '\t')) ++i;
    if (pending_.size() - i < 2) return false;

    if (pending_.compare(i, 2, "--") == 0) {
        state_ = State::Done;
        return false;
    }
    if (pending_.compare(i, 2, "\r\n") != 0) {
        throw MalformedRequestError("Garbage after multipart boundary");
    }
    pending_.erase(0, i + 2);
    state_ = State::Headers;
    return true;
}

bool MultipartParser::processHeaders() {
    std::string block;
    if (pending_.compare(0, 2, "\r\n") == 0) {
        // Part without headers
        pending_.erase(0, 2);
    } else {
        size_t end = pending_.find("\r\n\r\n");
        if (end == std::string::npos) {
            if (pending_.size() > MAX_PART_HEADER_SIZE) {
                throw MalformedRequestError("Multipart part headers too large");
            }
            return false;
        }
        if (end > MAX_PART_HEADER_SIZE) {
            throw MalformedRequestError("Multipart part headers too large");
        }
        block = pending_.substr(0, end);
        pending_.erase(0, end + 4);
    }

    MultipartPart part;
    parsePartHeaders(block, part);
    if (callbacks_.onPartBegin) callbacks_.onPartBegin(part);
    state_ = State::Body;
    return true;
}

bool MultipartParser::processBody() {
    size_t pos = pending_.find(delimiter_);
    if (pos == std::string::npos) {
        if (pending_.size() >= delimiter_.size()) {
            size_t emit = pending_.size() - (delimiter_.size() - 1);
            if (callbacks_.onData) callbacks_.onData(pending_.data(), emit);
            pending_.erase(0, emit);
        }
        return false;
    }

    if (pos > 0 && callbacks_.onData) callbacks_.onData(pending_.data(), pos);
    if (callbacks_.onPartEnd) callbacks_.onPartEnd();
    pending_.erase(0, pos + delimiter_.size());
    state_ = State::AfterBoundary;
    return true;
}

std::vector<MultipartPart> MultipartParser::parse(const std::string& body, const std::string& boundary) {
    std::vector<MultipartPart> parts;

    Callbacks callbacks;
    callbacks.onPartBegin = [&parts](const MultipartPart& part) { parts.push_back(part); };
    callbacks.onData = [&parts](const char* data, size_t size) {
        auto& buf = parts.back().data;
        buf.insert(buf.end(), data, data + size);
    };

    MultipartParser parser(boundary, std::move(callbacks));
    parser.feed(body.data(), body.size());
    parser.finish();
    return parts;
}

} // namespace http
} // namespace dropzone
