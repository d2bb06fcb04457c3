#include "content_store.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>

#include "peer_error.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

bool is_hidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

SystemTime to_system_time(fs::file_time_type t) {
    return std::chrono::time_point_cast<SystemTime::duration>(
        t - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

std::string doc_content_type(const std::string& filename) {
    auto dot = filename.rfind('.');
    const auto ext = dot == std::string::npos ? std::string() : to_lower_ascii(filename.substr(dot + 1));
    if(ext == "md") return "markdown";
    if(ext == "txt" || ext == "rst") return "text";
    if(ext == "html") return "html";
    return "binary";
}

std::string stem_of(const std::string& filename) {
    auto dot = filename.rfind('.');
    return (dot == std::string::npos || dot == 0) ? filename : filename.substr(0, dot);
}

bool directory_exists(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

bool regular_file_exists(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

std::atomic<unsigned> g_temp_counter{0};

} // namespace

std::string read_file_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if(!in) {
        throw_peer_error(ErrorKind::Internal, "cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if(in.bad()) {
        throw_peer_error(ErrorKind::Internal, "read failed for " + path.string());
    }
    return ss.str();
}

ContentStore::ContentStore(fs::path root, std::shared_ptr<Logger> logger)
    : root_(std::move(root)), logger_(std::move(logger)) {}

void ContentStore::validate_component(const std::string& value, const char* what) {
    auto reject = [&](const std::string& why) {
        throw_peer_error(ErrorKind::FormatError, std::string(what) + " " + why);
    };
    if(value.empty()) reject("is empty");
    if(value.find('/') != std::string::npos || value.find('\\') != std::string::npos) {
        reject("must not contain path separators");
    }
    if(value.find('\0') != std::string::npos) reject("must not contain NUL");
    if(value.find("..") != std::string::npos) reject("must not contain '..'");
    if(value[0] == '.') reject("must not start with '.'");
}

fs::path ContentStore::kind_dir(MediaKind kind) const {
    return root_ / media_kind_name(kind);
}

fs::path ContentStore::cache_kind_dir(const std::string& peer_id, MediaKind kind) const {
    validate_component(peer_id, "peer id");
    return root_ / kDownloadedDir / peer_id / media_kind_name(kind);
}

void ContentStore::ensure_layout() const {
    std::error_code ec;
    for(auto kind : all_media_kinds()) {
        fs::create_directories(kind_dir(kind), ec);
        if(ec) {
            throw_peer_error(ErrorKind::Internal,
                             "cannot create " + kind_dir(kind).string() + ": " + ec.message());
        }
    }
    fs::create_directories(root_ / kDownloadedDir, ec);
    if(!ec) fs::create_directories(config_dir(), ec);
    if(ec) {
        throw_peer_error(ErrorKind::Internal, "cannot prepare workspace: " + ec.message());
    }
}

FolderInfo ContentStore::scan() const {
    FolderInfo info;
    info.path = root_.string();
    info.last_scan = format_iso8601(std::chrono::system_clock::now());

    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if(ec) {
        log_warn(logger_.get(), "scan of {} failed: {}", root_.string(), ec.message());
        return info;
    }
    for(fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if(ec) {
            log_warn(logger_.get(), "scan error: {}", ec.message());
            break;
        }
        const auto name = it->path().filename().string();
        if(it.depth() == 0 && it->is_directory(ec) &&
           (name == kDownloadedDir || name == kConfigDir)) {
            it.disable_recursion_pending();
            continue;
        }
        if(it->is_regular_file(ec) && !is_hidden(name)) {
            info.files.push_back(fs::relative(it->path(), root_, ec).generic_string());
        }
    }
    std::sort(info.files.begin(), info.files.end());
    return info;
}

std::vector<std::string> ContentStore::list_files(const fs::path& dir, MediaKind kind) const {
    std::vector<std::string> files;
    std::error_code ec;
    for(const auto& entry : fs::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if(is_hidden(name) || !entry.is_regular_file(ec)) continue;
        if(!media_kind_accepts(kind, name)) continue;
        files.push_back(name);
    }
    if(ec) {
        log_debug(logger_.get(), "listing {}: {}", dir.string(), ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<GalleryDescriptor> ContentStore::list_galleries(const fs::path& dir, MediaKind kind,
                                                            GallerySource source) const {
    std::vector<GalleryDescriptor> out;
    std::error_code ec;
    for(const auto& entry : fs::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if(is_hidden(name) || !entry.is_directory(ec)) continue;
        GalleryDescriptor g;
        g.name = name;
        g.kind = kind;
        g.source = source;
        g.files = list_files(entry.path(), kind);
        out.push_back(std::move(g));
    }
    std::sort(out.begin(), out.end(),
              [](const GalleryDescriptor& a, const GalleryDescriptor& b){ return a.name < b.name; });
    return out;
}

std::vector<GalleryDescriptor> ContentStore::galleries(MediaKind kind) const {
    return list_galleries(kind_dir(kind), kind, GallerySource::Live);
}

GalleryDescriptor ContentStore::gallery(MediaKind kind, const std::string& name) const {
    validate_component(name, "gallery");
    const auto dir = kind_dir(kind) / name;
    if(!directory_exists(dir)) {
        throw_peer_error(ErrorKind::NotFound,
                         std::string("no ") + media_kind_name(kind) + " gallery '" + name + "'");
    }
    GalleryDescriptor g;
    g.name = name;
    g.kind = kind;
    g.files = list_files(dir, kind);
    return g;
}

std::string ContentStore::read_file(MediaKind kind, const std::string& gallery,
                                    const std::string& file) const {
    validate_component(gallery, "gallery");
    validate_component(file, "file");
    const auto path = kind_dir(kind) / gallery / file;
    if(!regular_file_exists(path) || !media_kind_accepts(kind, file)) {
        throw_peer_error(ErrorKind::NotFound, "no file " + gallery + "/" + file);
    }
    return read_file_bytes(path);
}

DocSummary ContentStore::summarize_doc(const fs::path& full, const std::string& rel) const {
    DocSummary d;
    d.path = rel;
    const auto filename = full.filename().string();
    d.title = stem_of(filename);
    d.content_type = doc_content_type(filename);
    std::error_code ec;
    d.size = fs::file_size(full, ec);
    if(ec) d.size = 0;
    auto mtime = fs::last_write_time(full, ec);
    d.modified = ec ? std::string() : format_iso8601(to_system_time(mtime));
    return d;
}

std::vector<DocSummary> ContentStore::docs() const {
    std::vector<DocSummary> out;
    const auto docs_dir = kind_dir(MediaKind::Docs);
    for(const auto& file : list_files(docs_dir, MediaKind::Docs)) {
        out.push_back(summarize_doc(docs_dir / file, file));
    }
    for(const auto& g : galleries(MediaKind::Docs)) {
        for(const auto& file : g.files) {
            out.push_back(summarize_doc(docs_dir / g.name / file, g.name + "/" + file));
        }
    }
    return out;
}

fs::path ContentStore::resolve_doc(const std::string& path) const {
    const auto parts = split(path, '/');
    if(parts.empty() || parts.size() > 2) {
        throw_peer_error(ErrorKind::FormatError, "doc path must be 'file' or 'gallery/file'");
    }
    for(const auto& part : parts) validate_component(part, "doc path component");
    fs::path full = kind_dir(MediaKind::Docs);
    for(const auto& part : parts) full /= part;
    if(!regular_file_exists(full) || !media_kind_accepts(MediaKind::Docs, parts.back())) {
        throw_peer_error(ErrorKind::NotFound, "no document '" + path + "'");
    }
    return full;
}

DocContent ContentStore::doc(const std::string& path) const {
    const auto full = resolve_doc(path);
    DocContent d;
    d.summary = summarize_doc(full, path);
    if(d.summary.content_type != "binary") {
        d.content = read_file_bytes(full);
    }
    return d;
}

std::string ContentStore::read_doc_bytes(const std::string& path) const {
    return read_file_bytes(resolve_doc(path));
}

std::vector<GalleryDescriptor> ContentStore::cached_galleries(const std::string& peer_id,
                                                              MediaKind kind) const {
    const auto dir = cache_kind_dir(peer_id, kind);
    if(!directory_exists(dir)) return {};
    return list_galleries(dir, kind, GallerySource::Downloaded);
}

GalleryDescriptor ContentStore::cached_gallery(const std::string& peer_id, MediaKind kind,
                                               const std::string& name) const {
    validate_component(name, "gallery");
    const auto dir = cache_kind_dir(peer_id, kind) / name;
    if(!directory_exists(dir)) {
        throw_peer_error(ErrorKind::NotFound, "no downloaded gallery '" + name + "' for " + peer_id);
    }
    GalleryDescriptor g;
    g.name = name;
    g.kind = kind;
    g.source = GallerySource::Downloaded;
    g.files = list_files(dir, kind);
    return g;
}

fs::path ContentStore::cached_file_path(const std::string& peer_id, MediaKind kind,
                                        const std::string& gallery, const std::string& file) const {
    validate_component(gallery, "gallery");
    validate_component(file, "file");
    const auto path = cache_kind_dir(peer_id, kind) / gallery / file;
    if(!regular_file_exists(path)) {
        throw_peer_error(ErrorKind::NotFound, "not downloaded: " + gallery + "/" + file);
    }
    return path;
}

std::string ContentStore::read_cached_file(const std::string& peer_id, MediaKind kind,
                                           const std::string& gallery, const std::string& file) const {
    return read_file_bytes(cached_file_path(peer_id, kind, gallery, file));
}

fs::path ContentStore::write_cached_file(const std::string& peer_id, MediaKind kind,
                                         const std::string& gallery, const std::string& file,
                                         const std::string& bytes) const {
    validate_component(gallery, "gallery");
    validate_component(file, "file");
    const auto dir = cache_kind_dir(peer_id, kind) / gallery;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if(ec) {
        throw_peer_error(ErrorKind::Internal, "cannot create " + dir.string() + ": " + ec.message());
    }
    const auto final_path = dir / file;
    const auto temp_path = dir / ("." + file + ".part" + std::to_string(g_temp_counter.fetch_add(1)));
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if(!out) {
            throw_peer_error(ErrorKind::Internal, "cannot write " + temp_path.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if(!out) {
            fs::remove(temp_path, ec);
            throw_peer_error(ErrorKind::Internal, "short write to " + temp_path.string());
        }
    }
    fs::rename(temp_path, final_path, ec);
    if(ec) {
        const auto message = ec.message();
        fs::remove(temp_path, ec);
        throw_peer_error(ErrorKind::Internal, "cannot move into place " + final_path.string() + ": " + message);
    }
    log_debug(logger_.get(), "cached {} ({} bytes)", final_path.string(), bytes.size());
    return final_path;
}
