//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinTools.cpp
// Purpose: Tools shipped with toolwire_server (echo, file_search, code_analysis, web_request, github_list_repos)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fnmatch.h>
#include <sys/stat.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolwire/errors/Errors.h"
#include "toolwire/tools/BuiltinTools.h"
#include "toolwire/tools/HttpFetch.h"

namespace toolwire::tools {
namespace fs = std::filesystem;
using errors::ErrorCategory;
using errors::ToolwireException;

namespace {

////////////////////////////////////////// JSON helpers ///////////////////////////////////////////
template <typename T>
std::shared_ptr<JSONValue> jv(T&& v) {
    return std::make_shared<JSONValue>(std::forward<T>(v));
}

std::shared_ptr<JSONValue> jint(std::uintmax_t v) {
    return std::make_shared<JSONValue>(static_cast<int64_t>(v));
}

JSONValue paramSpec(const char* type, const char* description) {
    JSONValue::Object o;
    o["type"] = jv(type);
    o["description"] = jv(description);
    return JSONValue{o};
}

std::string stringParam(const JSONValue& params, const std::string& key, const std::string& fallback) {
    const JSONValue* v = FindMember(params, key);
    if (!v || v->isNull()) {
        return fallback;
    }
    if (!v->isString()) {
        throw ToolwireException(ErrorCategory::Validation, "'" + key + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

int64_t intParam(const JSONValue& params, const std::string& key, int64_t fallback) {
    const JSONValue* v = FindMember(params, key);
    if (!v || v->isNull()) {
        return fallback;
    }
    auto n = GetIntMember(params, key);
    if (!n.has_value()) {
        throw ToolwireException(ErrorCategory::Validation, "'" + key + "' must be an integer");
    }
    return *n;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

////////////////////////////////////////// file_search ///////////////////////////////////////////
bool hasWildcard(const std::string& part) {
    return part.find_first_of("*?[") != std::string::npos;
}

std::vector<std::string> splitPattern(const std::string& pattern) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : pattern) {
        if (c == '/') {
            if (!cur.empty()) { parts.push_back(cur); }
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) { parts.push_back(cur); }
    return parts;
}

bool isRealDirectory(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(p, ec));
}

void globWalk(const fs::path& base, const std::vector<std::string>& parts, std::size_t idx,
              std::set<std::string>& out) {
    if (idx == parts.size()) {
        out.insert(base.lexically_normal().string());
        return;
    }
    const std::string& part = parts[idx];
    std::error_code ec;
    if (part == "**") {
        globWalk(base, parts, idx + 1, out);
        for (fs::directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec)) {
            if (isRealDirectory(it->path())) {
                globWalk(it->path(), parts, idx, out);
            }
        }
        return;
    }
    const bool last = idx + 1 == parts.size();
    if (!hasWildcard(part)) {
        fs::path next = base / part;
        if (fs::exists(next, ec) && (last || fs::is_directory(next, ec))) {
            globWalk(next, parts, idx + 1, out);
        }
        return;
    }
    for (fs::directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (::fnmatch(part.c_str(), name.c_str(), 0) != 0) {
            continue;
        }
        if (last || fs::is_directory(it->path(), ec)) {
            globWalk(it->path(), parts, idx + 1, out);
        }
    }
}

JSONValue fileEntry(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        throw std::runtime_error("stat failed");
    }
    const bool isDir = S_ISDIR(st.st_mode);
    JSONValue::Object o;
    o["path"] = jv(path);
    o["name"] = jv(fs::path(path).filename().string());
    o["is_dir"] = jv(isDir);
    o["size"] = S_ISREG(st.st_mode) ? jint(static_cast<std::uintmax_t>(st.st_size)) : jv(nullptr);
    o["modified"] = jv(static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9);
    return JSONValue{o};
}

////////////////////////////////////////// code_analysis ///////////////////////////////////////////
std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string cur;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(cur);
            cur.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') { ++i; }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) { lines.push_back(cur); }
    return lines;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\f\v");
    if (b == std::string::npos) {
        return std::string();
    }
    auto e = s.find_last_not_of(" \t\f\v");
    return s.substr(b, e - b + 1);
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool isCommentLine(const std::string& t) {
    return startsWith(t, "#") || startsWith(t, "//") || startsWith(t, "/*") || startsWith(t, "*");
}

JSONValue analyzeFile(const fs::path& path, const std::string& analysisType) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Error analyzing file: cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    const std::vector<std::string> lines = splitLines(ss.str());

    JSONValue::Object o;
    o["file"] = jv(path.string());
    o["size"] = jint(fs::file_size(path));
    o["lines"] = jint(lines.size());
    const std::string extension = lower(path.extension().string());
    o["extension"] = jv(extension);

    if (analysisType == "syntax") {
        std::size_t empty = 0, comments = 0, code = 0;
        for (const auto& line : lines) {
            std::string t = trim(line);
            if (t.empty()) { ++empty; }
            else if (isCommentLine(t)) { ++comments; }
            else { ++code; }
        }
        o["empty_lines"] = jint(empty);
        o["comment_lines"] = jint(comments);
        o["code_lines"] = jint(code);
    } else if (analysisType == "complexity") {
        std::size_t total = 0, longest = 0, functions = 0;
        for (const auto& line : lines) {
            total += line.size();
            longest = std::max(longest, line.size());
            if (line.find("def ") != std::string::npos || line.find("function ") != std::string::npos) {
                ++functions;
            }
        }
        o["avg_line_length"] = jv(static_cast<double>(total) / static_cast<double>(std::max<std::size_t>(lines.size(), 1)));
        o["max_line_length"] = jint(longest);
        o["function_count"] = jint(functions);
    } else if (analysisType == "dependencies") {
        const bool python = extension == ".py";
        const bool script = extension == ".js" || extension == ".ts" || extension == ".jsx" || extension == ".tsx";
        if (python || script) {
            JSONValue::Array imports;
            for (const auto& line : lines) {
                std::string t = trim(line);
                bool hit = python ? (startsWith(t, "import ") || startsWith(t, "from "))
                                  : (line.find("import ") != std::string::npos || line.find("require(") != std::string::npos);
                if (hit) {
                    imports.push_back(jv(t));
                }
            }
            o["imports"] = jv(std::move(imports));
        }
    }
    return JSONValue{o};
}

JSONValue analyzeDirectory(const fs::path& path) {
    std::size_t fileCount = 0;
    std::uintmax_t totalSize = 0;
    std::map<std::string, std::size_t> byExtension;
    std::error_code ec;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) {
            continue;
        }
        ++fileCount;
        auto sz = it->file_size(fec);
        if (!fec) { totalSize += sz; }
        ++byExtension[lower(it->path().extension().string())];
    }
    if (ec) {
        LOG_WARN("code_analysis: directory walk of {} stopped early: {}", path.string(), ec.message());
    }
    JSONValue::Object types;
    for (const auto& [ext, count] : byExtension) {
        types[ext] = jint(count);
    }
    JSONValue::Object o;
    o["directory"] = jv(path.string());
    o["file_count"] = jint(fileCount);
    o["total_size"] = jint(totalSize);
    o["file_types"] = jv(std::move(types));
    return JSONValue{o};
}

////////////////////////////////////////// github ///////////////////////////////////////////
bool validGithubName(const std::string& name) {
    if (name.empty() || name.size() > 39) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isalnum(c) || c == '-'; });
}

std::shared_ptr<JSONValue> memberOrNull(const JSONValue& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    return v ? std::make_shared<JSONValue>(*v) : jv(nullptr);
}

} // namespace

JSONValue Echo(const JSONValue& params) {
    return params;
}

JSONValue FileSearch(const JSONValue& params) {
    const std::string directory = stringParam(params, "directory", ".");
    const std::string pattern = stringParam(params, "pattern", "*");
    if (!pattern.empty() && pattern.front() == '/') {
        throw ToolwireException(ErrorCategory::Validation, "Non-relative patterns are unsupported");
    }
    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        throw std::runtime_error("Directory '" + directory + "' does not exist");
    }
    std::vector<std::string> parts = splitPattern(pattern);
    if (parts.empty()) {
        throw ToolwireException(ErrorCategory::Validation, "Unacceptable pattern: '" + pattern + "'");
    }

    std::set<std::string> matches;
    globWalk(fs::path(directory), parts, 0, matches);

    JSONValue::Array files;
    for (const auto& path : matches) {
        try {
            files.push_back(jv(fileEntry(path)));
        } catch (const std::exception& e) {
            LOG_ERROR("Error getting file info for {}: {}", path, e.what());
        }
    }
    JSONValue::Object result;
    const std::size_t count = files.size();
    result["files"] = jv(std::move(files));
    result["count"] = jint(count);
    return JSONValue{result};
}

JSONValue CodeAnalysis(const JSONValue& params) {
    const std::string path = stringParam(params, "path", "");
    const std::string analysisType = stringParam(params, "analysis_type", "syntax");
    if (path.empty()) {
        throw ToolwireException(ErrorCategory::Validation, "No path provided");
    }
    if (analysisType != "syntax" && analysisType != "complexity" && analysisType != "dependencies") {
        throw ToolwireException(ErrorCategory::Validation, "Unsupported analysis_type: " + analysisType);
    }
    std::error_code ec;
    fs::path p(path);
    if (!fs::exists(p, ec)) {
        throw std::runtime_error("Path '" + path + "' does not exist");
    }
    if (fs::is_regular_file(p, ec)) {
        return analyzeFile(p, analysisType);
    }
    if (fs::is_directory(p, ec)) {
        return analyzeDirectory(p);
    }
    throw std::runtime_error("Unknown path type: " + path);
}

JSONValue WebRequest(const JSONValue& params) {
    HttpFetchRequest req;
    req.url = stringParam(params, "url", "");
    if (req.url.empty()) {
        throw ToolwireException(ErrorCategory::Validation, "No URL provided");
    }
    req.method = stringParam(params, "method", "GET");
    const std::string method = lower(req.method);
    if (const JSONValue* headers = FindMember(params, "headers"); headers && !headers->isNull()) {
        if (!headers->isObject()) {
            throw ToolwireException(ErrorCategory::Validation, "'headers' must be an object");
        }
        for (const auto& [name, value] : std::get<JSONValue::Object>(headers->value)) {
            if (value && value->isString()) {
                req.headers.emplace_back(name, std::get<std::string>(value->value));
            } else if (value) {
                req.headers.emplace_back(name, SerializeJSON(*value));
            }
        }
    }
    if (const JSONValue* data = FindMember(params, "data"); data && !data->isNull() && (method == "post" || method == "put")) {
        req.body = SerializeJSON(*data);
        req.headers.emplace_back("Content-Type", "application/json");
    }

    HttpFetchResponse res = HttpFetch(req);

    JSONValue::Object headerObj;
    for (const auto& [name, value] : res.headers) {
        headerObj[lower(name)] = jv(value);
    }
    JSONValue::Object out;
    out["status_code"] = jv(static_cast<int64_t>(res.status));
    out["headers"] = jv(std::move(headerObj));
    try {
        out["json"] = jv(ParseJSON(res.body));
    } catch (const std::exception&) {
        out["text"] = jv(std::move(res.body));
    }
    return JSONValue{out};
}

JSONValue GithubListRepos(const JSONValue& params) {
    std::string username = stringParam(params, "username", "");
    if (username.empty()) {
        username = GetEnvOrDefault("GITHUB_USERNAME", "");
        LOG_INFO("Using default GitHub username from environment: {}", username);
    }
    if (username.empty()) {
        LOG_ERROR("No username provided for github_list_repos and no default username in environment");
        throw ToolwireException(ErrorCategory::Validation, "No username provided and no default username configured");
    }
    if (!validGithubName(username)) {
        throw ToolwireException(ErrorCategory::Validation, "Invalid GitHub username: " + username);
    }
    const int64_t perPage = intParam(params, "per_page", 30);
    const int64_t page = intParam(params, "page", 1);
    if (perPage < 1 || perPage > 100 || page < 1) {
        throw ToolwireException(ErrorCategory::Validation, "per_page must be 1..100 and page at least 1");
    }

    HttpFetchRequest req;
    req.url = "https://api.github.com/users/" + username + "/repos?per_page=" + std::to_string(perPage) +
              "&page=" + std::to_string(page) + "&sort=updated";
    req.headers.emplace_back("Accept", "application/vnd.github.v3+json");
    LOG_INFO("Fetching GitHub repositories for user: {}", username);
    HttpFetchResponse res = HttpFetch(req);
    LOG_INFO("GitHub API response status code: {}", res.status);

    if (res.status != 200) {
        std::string message = "Unknown error";
        try {
            if (auto m = GetStringMember(ParseJSON(res.body), "message")) {
                message = *m;
            }
        } catch (const std::exception& e) {
            LOG_DEBUG("GitHub error body is not JSON: {}", e.what());
        }
        LOG_ERROR("GitHub API error: {}", message);
        throw std::runtime_error("GitHub API returned status code " + std::to_string(res.status) + ": " + message);
    }

    JSONValue repos = ParseJSON(res.body);
    if (!repos.isArray()) {
        throw std::runtime_error("GitHub API returned an unexpected payload");
    }
    JSONValue::Array list;
    for (const auto& repo : std::get<JSONValue::Array>(repos.value)) {
        if (!repo || !repo->isObject()) {
            continue;
        }
        JSONValue::Object o;
        o["name"] = memberOrNull(*repo, "name");
        o["full_name"] = memberOrNull(*repo, "full_name");
        o["description"] = memberOrNull(*repo, "description");
        o["html_url"] = memberOrNull(*repo, "html_url");
        o["language"] = memberOrNull(*repo, "language");
        o["stars"] = memberOrNull(*repo, "stargazers_count");
        o["forks"] = memberOrNull(*repo, "forks_count");
        o["updated_at"] = memberOrNull(*repo, "updated_at");
        o["private"] = memberOrNull(*repo, "private");
        list.push_back(jv(JSONValue{o}));
    }
    LOG_INFO("Found {} repositories for user {}", list.size(), username);

    JSONValue::Object out;
    const std::size_t count = list.size();
    out["repositories"] = jv(std::move(list));
    out["count"] = jint(count);
    out["page"] = jv(page);
    out["per_page"] = jv(perPage);
    return JSONValue{out};
}

void RegisterBuiltinTools(ToolRegistry& registry) {
    registry.Register("echo", "Echo the parameters back to the caller", JSONValue{JSONValue::Object{}},
                      MakeSyncHandler(&Echo));

    JSONValue::Object fileSearch;
    fileSearch["directory"] = jv(paramSpec("string", "Directory to search in"));
    fileSearch["pattern"] = jv(paramSpec("string", "Search pattern (glob format)"));
    registry.Register("file_search", "Search for files in a directory", JSONValue{fileSearch},
                      MakeSyncHandler(&FileSearch));

    JSONValue::Object codeAnalysis;
    codeAnalysis["path"] = jv(paramSpec("string", "Path to file or directory to analyze"));
    codeAnalysis["analysis_type"] =
        jv(paramSpec("string", "Type of analysis to perform (syntax, complexity, dependencies)"));
    registry.Register("code_analysis", "Analyze code in a file or directory", JSONValue{codeAnalysis},
                      MakeSyncHandler(&CodeAnalysis));

    JSONValue::Object webRequest;
    webRequest["url"] = jv(paramSpec("string", "URL to send the request to"));
    webRequest["method"] = jv(paramSpec("string", "HTTP method (GET, POST, PUT, DELETE)"));
    webRequest["headers"] = jv(paramSpec("object", "HTTP headers to include"));
    webRequest["data"] = jv(paramSpec("object", "Data to send in the request body"));
    registry.Register("web_request", "Make HTTP requests to external APIs", JSONValue{webRequest},
                      MakeSyncHandler(&WebRequest));

    JSONValue::Object github;
    github["username"] = jv(paramSpec("string", "GitHub username (optional, uses default if not provided)"));
    github["per_page"] = jv(paramSpec("integer", "Number of repositories per page (default: 30)"));
    github["page"] = jv(paramSpec("integer", "Page number (default: 1)"));
    registry.Register("github_list_repos", "List repositories for a GitHub user", JSONValue{github},
                      MakeSyncHandler(&GithubListRepos));
}

} // namespace toolwire::tools
