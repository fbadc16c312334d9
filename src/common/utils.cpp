/*
 * RoomRelay - utility helpers implementation
 */

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace roomrelay {

namespace {
std::mutex g_log_mutex;
LogLevel g_current_level = LogLevel::Info;
std::shared_ptr<FileLogger> g_file_sink;

// Values travel inside "k=v;k=v" lists, so the separators are escaped.
std::string kv_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '%':
                out += "%25";
                break;
            case ';':
                out += "%3B";
                break;
            case '=':
                out += "%3D";
                break;
            default:
                out += ch;
        }
    }
    return out;
}

std::string kv_unescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            std::string code = value.substr(i + 1, 2);
            if (code == "25") {
                out += '%';
                i += 2;
                continue;
            }
            if (code == "3B" || code == "3b") {
                out += ';';
                i += 2;
                continue;
            }
            if (code == "3D" || code == "3d") {
                out += '=';
                i += 2;
                continue;
            }
        }
        out += value[i];
    }
    return out;
}
} // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_current_level = level;
}

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = trim(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    throw std::invalid_argument("Unknown log level: " + name);
}

std::string log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "LOG";
    }
}

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    localtime_r(&tt, &tm_now);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_now);
    return buffer;
}

void log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_current_level)) {
        return;
    }
    std::string line = "[" + log_level_name(level) + " " + timestamp_now() + "] " + message;
    std::cerr << line << std::endl;
    if (!g_file_sink) {
        return;
    }
    try {
        g_file_sink->write(line);
    } catch (const std::exception& ex) {
        std::cerr << "[WARN " << timestamp_now() << "] file logging disabled: " << ex.what() << std::endl;
        g_file_sink.reset();
    }
}

void attach_log_file(std::shared_ptr<FileLogger> sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_file_sink = std::move(sink);
}

std::vector<uint8_t> random_bytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buffer;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return {};
    }
    std::string output;
    output.resize(((data.size() + 2) / 3) * 4);
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                              data.data(),
                              static_cast<int>(data.size()));
    if (len < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    output.resize(static_cast<std::size_t>(len));
    return output;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return std::vector<uint8_t>();
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> output;
    output.resize((encoded.size() / 4) * 3);
    int len = EVP_DecodeBlock(output.data(),
                              reinterpret_cast<const unsigned char*>(encoded.data()),
                              static_cast<int>(encoded.size()));
    if (len < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes.
    std::size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') {
        padding++;
    }
    if (encoded[encoded.size() - 2] == '=') {
        padding++;
    }
    output.resize(static_cast<std::size_t>(len) - padding);
    return output;
}

std::string nanos_token() {
    auto now = std::chrono::system_clock::now();
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    std::ostringstream oss;
    oss << std::hex << static_cast<uint64_t>(nanos);
    return oss.str();
}

std::string kv_string(const std::map<std::string, std::string>& values) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : values) {
        if (!first) {
            oss << ';';
        }
        first = false;
        oss << kv_escape(key) << '=' << kv_escape(value);
    }
    return oss.str();
}

std::map<std::string, std::string> parse_kv_string(const std::string& input) {
    std::map<std::string, std::string> result;
    std::string token;
    std::istringstream iss(input);
    while (std::getline(iss, token, ';')) {
        auto pos = token.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = trim(token.substr(0, pos));
        if (key.empty()) {
            continue;
        }
        result[kv_unescape(key)] = kv_unescape(token.substr(pos + 1));
    }
    return result;
}

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch);
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::string token;
    std::istringstream iss(input);
    while (std::getline(iss, token, delimiter)) {
        parts.push_back(token);
    }
    return parts;
}

FileLogger::FileLogger(std::string path) : path_(std::move(path)) {}

void FileLogger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open log file: " + path_);
    }
    out << line << '\n';
    out.flush();
}

} // namespace roomrelay
