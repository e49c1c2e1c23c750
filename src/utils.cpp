#include "utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

namespace {
std::string format_now(const char* pattern){
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, pattern);
    return oss.str();
}
} // namespace

std::string iso8601_now(){
    return format_now("%Y-%m-%dT%H:%M:%S");
}

std::optional<std::filesystem::path> relative_under(const std::filesystem::path& path,
                                                    const std::filesystem::path& root){
    auto norm_path = path.lexically_normal();
    auto norm_root = root.lexically_normal();
    if(norm_root.empty()) return std::nullopt;
    if(!norm_root.has_filename() && norm_root != norm_root.root_path()) {
        norm_root = norm_root.parent_path();
    }
    auto rel = norm_path.lexically_relative(norm_root);
    if(rel.empty() || rel == ".") return std::nullopt;
    auto first = *rel.begin();
    if(first == "..") return std::nullopt;
    return rel;
}

std::string trim(const std::string& value){
    auto begin = std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); });
    auto end = std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base();
    if(begin >= end) return {};
    return std::string(begin, end);
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string format_mib(unsigned long long bytes){
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << static_cast<double>(bytes) / (1024.0 * 1024.0);
    return oss.str();
}

namespace {
constexpr int kIoprioWhoProcess = 1;
constexpr int kIoprioClassIdle = 3;
constexpr int kIoprioClassShift = 13;
} // namespace

bool enter_background_priority(std::string& error){
    const auto tid = static_cast<pid_t>(::syscall(SYS_gettid));
    bool ok = true;
    error.clear();
    if(::setpriority(PRIO_PROCESS, static_cast<id_t>(tid), 19) != 0) {
        error = std::string("setpriority: ") + std::strerror(errno);
        ok = false;
    }
    const int ioprio = kIoprioClassIdle << kIoprioClassShift;
    if(::syscall(SYS_ioprio_set, kIoprioWhoProcess, tid, ioprio) != 0) {
        if(!error.empty()) error += "; ";
        error += std::string("ioprio_set: ") + std::strerror(errno);
        ok = false;
    }
    return ok;
}
