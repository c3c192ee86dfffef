#include "starjudge/compile_cache.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/detail/md5.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/version.hpp>
#include <algorithm>
#include <regex>
#include <system_error>

namespace starjudge {
using namespace std;
namespace fs = std::filesystem;

static const regex cache_file_pattern("^[0-9a-f]{32}\\.(exe|class)$");

compile_cache::compile_cache(const fs::path &cache_dir, size_t max_entries)
    : cache_dir(cache_dir), max_entries(max_entries) {
    error_code ec;
    fs::create_directories(cache_dir, ec);
    if (ec) {
        LOG(WARNING) << "Unable to create cache directory " << cache_dir << ": " << ec.message();
        return;
    }

    vector<pair<fs::file_time_type, fs::path>> found;
    for (fs::directory_iterator it(cache_dir, ec), end; !ec && it != end; it.increment(ec)) {
        string filename = it->path().filename().string();
        if (regex_match(filename, cache_file_pattern)) {
            error_code time_ec;
            auto write_time = fs::last_write_time(it->path(), time_ec);
            found.emplace_back(time_ec ? fs::file_time_type::min() : write_time, it->path());
        } else if (filename.front() == '.' && it->path().extension() == ".tmp") {
            // 上次运行时没有写完的临时文件
            error_code rm_ec;
            fs::remove(it->path(), rm_ec);
        }
    }
    if (ec) LOG(WARNING) << "Unable to index cache directory " << cache_dir << ": " << ec.message();

    // 以文件的修改时间作为初始的访问顺序，最早写入的缓存项最先被淘汰
    sort(found.begin(), found.end());
    for (auto &[write_time, path] : found) {
        string key = path.stem().string();
        auto existing = entries.find(key);
        if (existing != entries.end()) sorted_entries.erase(existing->second.access_time);
        entries[key] = {path, last_access_time};
        sorted_entries[last_access_time++] = key;
    }

    lock_guard<mutex> guard(mut);
    shrink();
    LOG(INFO) << "Compile cache " << cache_dir << " loaded with " << entries.size() << " entries";
}

string compile_cache::hash_key(language lang, const string &code) {
    string data = string(get_language_name(lang)) + ":" + code;
    boost::uuids::detail::md5 hash;
    hash.process_bytes(data.data(), data.size());
    boost::uuids::detail::md5::digest_type digest;
    hash.get_digest(digest);

    string result;
#if BOOST_VERSION >= 108600
    for (unsigned char byte : digest)
        result += fmt::format("{:02x}", byte);
#else
    // 旧版本的摘要为 4 个 32 位整数，每个整数的高字节在前
    for (unsigned int word : digest)
        result += fmt::format("{:08x}", word);
#endif
    return result;
}

optional<fs::path> compile_cache::get(const string &key) {
    lock_guard<mutex> guard(mut);
    auto it = entries.find(key);
    if (it == entries.end()) {
        ++miss_count;
        return nullopt;
    }

    error_code ec;
    if (!fs::is_regular_file(it->second.path, ec)) {
        LOG(INFO) << "Compile cache entry " << key << " is stale, file " << it->second.path << " no longer exists";
        sorted_entries.erase(it->second.access_time);
        entries.erase(it);
        ++miss_count;
        return nullopt;
    }

    touch(key);
    ++hit_count;
    return it->second.path;
}

bool compile_cache::put(const string &key, const fs::path &artifact, const string &extension) {
    fs::path target = cache_dir / (key + "." + extension);
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path tmp = cache_dir / fmt::format(".{}.{}.tmp", key, uuid);

    error_code ec;
    fs::create_directories(cache_dir, ec);
    if (!ec) fs::copy_file(artifact, tmp, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::rename(tmp, target, ec);
    if (ec) {
        LOG(WARNING) << "Unable to save " << artifact << " to compile cache: " << ec.message();
        error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    }

    lock_guard<mutex> guard(mut);
    auto it = entries.find(key);
    if (it == entries.end()) {
        entries[key] = {target, last_access_time};
        sorted_entries[last_access_time++] = key;
    } else {
        it->second.path = target;
        touch(key);
    }
    LOG(INFO) << "Saved " << artifact << " to compile cache as " << target;
    shrink();
    return true;
}

void compile_cache::touch(const string &key) {
    auto &e = entries.at(key);
    sorted_entries.erase(e.access_time);
    e.access_time = last_access_time++;
    sorted_entries[e.access_time] = key;
}

void compile_cache::shrink() {
    while (max_entries != 0 && entries.size() > max_entries) {
        auto oldest = sorted_entries.begin();
        auto it = entries.find(oldest->second);
        error_code ec;
        fs::remove(it->second.path, ec);
        if (ec) LOG(WARNING) << "Unable to remove cache file " << it->second.path << ": " << ec.message();
        LOG(INFO) << "Evicted " << oldest->second << " from compile cache";
        entries.erase(it);
        sorted_entries.erase(oldest);
    }
}

size_t compile_cache::size() const {
    lock_guard<mutex> guard(mut);
    return entries.size();
}

size_t compile_cache::hits() const {
    lock_guard<mutex> guard(mut);
    return hit_count;
}

size_t compile_cache::misses() const {
    lock_guard<mutex> guard(mut);
    return miss_count;
}

}  // namespace starjudge
