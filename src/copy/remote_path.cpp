#include <sshcopy/remote_path.hpp>
#include <sshcopy/log.hpp>
#include <cctype>

namespace sshcopy {

std::string unixy_path(const std::string& p) {
    std::string out = p;
    for (char& c : out) {
        if (c == '\\') c = '/';
    }
    return out;
}

bool is_unc_path(const std::string& p) {
    // \\server\share
    if (p.size() < 5 || p[0] != '\\' || p[1] != '\\') return false;
    auto sep = p.find('\\', 2);
    if (sep == std::string::npos || sep == 2) return false;
    return sep + 1 < p.size() && p[sep + 1] != '\\';
}

bool is_absolute_remote_path(const std::string& p) {
    if (p.empty()) return false;
    if (p[0] == '/' || p[0] == '\\') return true;
    return p.size() >= 3 && std::isalpha(static_cast<unsigned char>(p[0])) &&
           p[1] == ':' && (p[2] == '/' || p[2] == '\\');
}

std::string posix_normalize(const std::string& p) {
    if (p.empty()) return ".";

    bool absolute = p[0] == '/';
    bool trailing = p.back() == '/';

    std::vector<std::string> segs;
    size_t start = 0;
    while (start <= p.size()) {
        size_t end = p.find('/', start);
        if (end == std::string::npos) end = p.size();
        std::string seg = p.substr(start, end - start);
        start = end + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!segs.empty() && segs.back() != "..") {
                segs.pop_back();
            } else if (!absolute) {
                segs.push_back(seg);
            }
            continue;
        }
        segs.push_back(seg);
    }

    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < segs.size(); i++) {
        if (i > 0) out += '/';
        out += segs[i];
    }

    if (out.empty()) return absolute ? "/" : (trailing ? "./" : ".");
    if (trailing && out != "/") out += '/';
    return out;
}

std::string posix_join(const std::string& a, const std::string& b) {
    if (a.empty()) return posix_normalize(b);
    if (b.empty()) return posix_normalize(a);
    return posix_normalize(a + "/" + b);
}

std::string posix_dirname(const std::string& p) {
    if (p.empty()) return ".";

    // Ignore trailing slashes
    size_t end = p.size();
    while (end > 1 && p[end - 1] == '/') end--;

    auto slash = p.rfind('/', end - 1);
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";

    // Collapse a run of separators before the last component
    while (slash > 0 && p[slash - 1] == '/') slash--;
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string base_name(const std::string& p) {
    auto pos = p.find_last_of("/\\");
    if (pos == std::string::npos) return p;
    return p.substr(pos + 1);
}

std::string normalize_target_folder(const std::string& target_folder) {
    if (target_folder.empty()) return "./";
    // "~/" is not expanded by the SFTP server
    if (target_folder.rfind("~/", 0) == 0) {
        return "./" + target_folder.substr(2);
    }
    return target_folder;
}

std::string normalize_source_root(const std::string& source_root) {
    std::string out = posix_normalize(unixy_path(source_root));
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string map_remote_path(const std::string& local,
                            const std::string& source_root,
                            const std::string& target_folder,
                            bool flatten) {
    std::string relative;
    if (flatten) {
        relative = base_name(local);
    } else {
        relative = local.size() > source_root.size() ? local.substr(source_root.size()) : "";
        if (!relative.empty() && relative[0] == '\\') relative.erase(0, 1);
        if (!relative.empty() && relative[0] == '/') relative.erase(0, 1);
    }

    std::string target = posix_join(target_folder, relative);
    if (!is_absolute_remote_path(target) && !is_unc_path(target)) {
        target = "./" + target;
    }
    return unixy_path(target);
}

std::vector<MappedFile> map_files(const std::vector<std::string>& files,
                                  const std::string& source_root,
                                  const std::string& target_folder,
                                  bool flatten) {
    std::vector<MappedFile> mapped;
    mapped.reserve(files.size());
    for (const auto& f : files) {
        std::string remote = map_remote_path(f, source_root, target_folder, flatten);
        log::trace("%s -> %s", f.c_str(), remote.c_str());
        mapped.push_back({f, std::move(remote)});
    }
    return mapped;
}

} // namespace sshcopy
