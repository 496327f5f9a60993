#include "git_utils.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include "repo.hpp"

using namespace std;

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    fs::path marker = p / ".git";
    auto st = fs::symlink_status(marker, ec);
    if (ec)
        return false;
    return fs::is_directory(st);
}

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

git_repository* open_repo(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, repo.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH,
                                nullptr) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

optional<string> get_local_hash(git_repository* repo, string* error) {
    git_oid oid;
    if (git_reference_name_to_id(&oid, repo, "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_current_branch(git_repository* repo, string* error) {
    int detached = git_repository_head_detached(repo);
    if (detached == 1)
        return string(DETACHED_HEAD);
    git_reference* head = nullptr;
    int err = git_repository_head(&head, repo);
    if (err == 0) {
        reference_ptr ref(head);
        const char* name = git_reference_shorthand(ref.get());
        if (name && *name)
            return string(name);
        set_error(error);
        return nullopt;
    }
    if (err != GIT_EUNBORNBRANCH) {
        set_error(error);
        return nullopt;
    }
    // No commits yet: HEAD is still a symbolic ref naming the future branch.
    git_reference* raw = nullptr;
    if (git_reference_lookup(&raw, repo, "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr sym(raw);
    const char* target = git_reference_symbolic_target(sym.get());
    if (!target) {
        set_error(error);
        return nullopt;
    }
    string name = target;
    const string prefix = "refs/heads/";
    if (name.rfind(prefix, 0) == 0)
        name = name.substr(prefix.size());
    return name;
}

optional<string> get_remote_url(git_repository* repo, const string& remote, string* error) {
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, repo, remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        set_error(error);
        return nullopt;
    }
    return string(url);
}

vector<pair<string, string>> list_remotes(git_repository* repo) {
    vector<pair<string, string>> out;
    git_strarray names{nullptr, 0};
    if (git_remote_list(&names, repo) != 0)
        return out;
    for (size_t i = 0; i < names.count; ++i) {
        string name = names.strings[i];
        out.emplace_back(name, get_remote_url(repo, name).value_or(""));
    }
    git_strarray_dispose(&names);
    return out;
}

optional<bool> has_uncommitted_changes(git_repository* repo, bool include_untracked,
                                       string* error) {
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    if (include_untracked)
        opts.flags |= GIT_STATUS_OPT_INCLUDE_UNTRACKED;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, repo, &opts) != 0) {
        set_error(error);
        return nullopt;
    }
    status_list_ptr list(raw_list);
    return git_status_list_entrycount(list.get()) > 0;
}

optional<std::time_t> get_last_commit_time(git_repository* repo, string* error) {
    git_oid oid;
    int err = git_reference_name_to_id(&oid, repo, "HEAD");
    if (err == GIT_ENOTFOUND || err == GIT_EUNBORNBRANCH)
        return nullopt; // no commits yet
    if (err != 0) {
        set_error(error);
        return nullopt;
    }
    git_commit* raw = nullptr;
    if (git_commit_lookup(&raw, repo, &oid) != 0) {
        set_error(error);
        return nullopt;
    }
    commit_ptr commit(raw);
    return static_cast<std::time_t>(git_commit_time(commit.get()));
}

string get_last_commit_author(git_repository* repo) {
    git_oid oid;
    if (git_reference_name_to_id(&oid, repo, "HEAD") != 0)
        return "";
    git_commit* raw = nullptr;
    if (git_commit_lookup(&raw, repo, &oid) != 0)
        return "";
    commit_ptr commit(raw);
    const git_signature* sig = git_commit_author(commit.get());
    if (!sig || !sig->name)
        return "";
    return string(sig->name);
}

static string strip_git_suffix(string s) {
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    const string suffix = ".git";
    if (s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0)
        s.erase(s.size() - suffix.size());
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    return s;
}

string normalize_remote_url(const string& url) {
    string s = url;
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                    [](unsigned char c) { return !std::isspace(c); }));
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
    string host;
    string path;
    size_t scheme = s.find("://");
    if (scheme != string::npos) {
        string rest = s.substr(scheme + 3);
        size_t slash = rest.find('/');
        host = rest.substr(0, slash);
        path = slash == string::npos ? "" : rest.substr(slash + 1);
    } else {
        size_t colon = s.find(':');
        size_t slash = s.find('/');
        if (colon == string::npos || (slash != string::npos && slash < colon))
            return strip_git_suffix(s); // local path
        host = s.substr(0, colon);
        path = s.substr(colon + 1);
    }
    size_t at = host.rfind('@');
    if (at != string::npos)
        host = host.substr(at + 1);
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!path.empty() && path.front() == '/')
        path.erase(path.begin());
    return strip_git_suffix(host + "/" + path);
}

string clone_dir_name(const string& url) {
    string s = strip_git_suffix(url);
    size_t pos = s.find_last_of("/:");
    if (pos != string::npos)
        s = s.substr(pos + 1);
    return s;
}

} // namespace git
