#include "cartoon_source.hpp"
#include "core/config.hpp"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

namespace pepterm {

namespace fs = std::filesystem;

namespace {

std::string to_upper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    for (size_t i = 0; i < suffix.size(); ++i) {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(s[s.size() - suffix.size() + i])));
        if (a != suffix[i]) return false;
    }
    return true;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

bool is_executable(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && !ec && access(path.c_str(), X_OK) == 0;
}

}

InputKind classify_input(const std::string& input) {
    if (ends_with_ci(input, ".obj")) return InputKind::ObjFile;
    if (ends_with_ci(input, ".pdb") || ends_with_ci(input, ".cif") ||
        input.find('/') != std::string::npos || input.find('\\') != std::string::npos) {
        return InputKind::StructureFile;
    }
    return InputKind::PdbId;
}

bool is_plain_identifier(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isalnum(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

StructureCache::StructureCache(std::string dir) : dir_(std::move(dir)) {}

std::string StructureCache::default_dir() {
    const char* xdg_cache = std::getenv("XDG_CACHE_HOME");
    if (xdg_cache && *xdg_cache) return std::string(xdg_cache) + "/pepterm";
    return get_home_dir() + "/.cache/pepterm";
}

Result StructureCache::ensure() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result::fail(ErrorCode::PROCESSING_ERROR,
                            "Cannot create cache directory " + dir_ + ": " + ec.message());
    }
    return Result::ok();
}

Result StructureCache::info(CacheInfo& out) const {
    out = CacheInfo{};
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return Result::ok();

    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec) || fec) continue;
        uintmax_t size = it->file_size(fec);
        if (fec) continue;
        out.files++;
        out.bytes += static_cast<uint64_t>(size);
    }
    if (ec) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "Cannot read cache directory: " + ec.message());
    }
    return Result::ok();
}

Result StructureCache::clear(size_t& removed) const {
    removed = 0;
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return Result::ok();

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec) && !fec) files.push_back(it->path());
    }
    if (ec) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "Cannot read cache directory: " + ec.message());
    }

    for (const auto& path : files) {
        if (!fs::remove(path, ec) || ec) {
            return Result::fail(ErrorCode::PROCESSING_ERROR,
                                "Cannot remove " + path.string() + ": " + ec.message());
        }
        removed++;
    }
    return Result::ok();
}

std::string StructureCache::remote_obj_path(const std::string& pdb_id, const std::string& chain) const {
    std::string name = to_upper(pdb_id);
    if (!chain.empty()) name += "_" + to_upper(chain);
    return (fs::path(dir_) / (name + ".obj")).string();
}

std::string StructureCache::local_obj_path(const std::string& structure_path, const std::string& chain) const {
    std::string stem = fs::path(structure_path).stem().string();
    if (stem.empty()) stem = "unknown";
    std::string name = "local_" + stem;
    if (!chain.empty()) name += "_" + to_upper(chain);
    return (fs::path(dir_) / (name + ".obj")).string();
}

std::string StructureCache::script_path() const {
    return (fs::path(dir_) / "pymol_script.pml").string();
}

std::string selection_commands(const std::string& chain) {
    if (chain.empty()) return "hide everything\nshow cartoon";
    return "select sel, chain " + to_upper(chain) + "\nhide everything\nshow cartoon, sel";
}

std::string build_fetch_script(const std::string& fetch_dir, const std::string& pdb_id,
                               const std::string& chain, const std::string& obj_path, int sampling) {
    std::ostringstream ss;
    ss << "set fetch_path, " << fetch_dir << "\n"
       << "fetch " << to_upper(pdb_id) << ", async=0\n"
       << selection_commands(chain) << "\n"
       << "set cartoon_sampling, " << sampling << "\n"
       << "save " << obj_path << "\n"
       << "quit\n";
    return ss.str();
}

std::string build_load_script(const std::string& structure_path, const std::string& chain,
                              const std::string& obj_path, int sampling) {
    std::ostringstream ss;
    ss << "load " << structure_path << "\n"
       << selection_commands(chain) << "\n"
       << "set cartoon_sampling, " << sampling << "\n"
       << "save " << obj_path << "\n"
       << "quit\n";
    return ss.str();
}

CartoonSource::CartoonSource(const Options& options, StructureCache cache)
    : options_(options), cache_(std::move(cache)) {}

std::string CartoonSource::find_pymol() const {
    const std::string& name = options_.pymol_path;
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return is_executable(name) ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";
    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable(candidate)) return candidate;
    }
    return "";
}

Result CartoonSource::run_pymol(const std::string& script, const std::string& obj_path,
                                const std::string& missing_output) const {
    const std::string pymol = find_pymol();
    if (pymol.empty()) {
        return Result::fail(ErrorCode::TOOL_ERROR,
                            "PyMOL not found. Install PyMOL or set loader.pymol_path (looked for '" +
                            options_.pymol_path + "')");
    }

    const std::string script_path = cache_.script_path();
    {
        std::ofstream out(script_path);
        if (!out || !(out << script)) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "Cannot write PyMOL script: " + script_path);
        }
    }

    const std::string cmd = shell_quote(pymol) + " -cq " + shell_quote(script_path) + " 2>&1";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return Result::fail(ErrorCode::TOOL_ERROR, std::string("Cannot start PyMOL: ") + std::strerror(errno));
    }

    std::string output;
    char buf[4096];
    while (fgets(buf, sizeof(buf), pipe)) output += buf;
    int status = pclose(pipe);

    if (status == -1) {
        return Result::fail(ErrorCode::TOOL_ERROR, std::string("PyMOL did not finish: ") + std::strerror(errno));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Result::fail(ErrorCode::TOOL_ERROR, "PyMOL failed: " + output);
    }

    std::error_code ec;
    if (!fs::exists(obj_path, ec)) {
        return Result::fail(ErrorCode::TOOL_ERROR, missing_output);
    }
    return Result::ok();
}

Result CartoonSource::resolve(const std::string& input, const std::string& chain, std::string& obj_path) const {
    const InputKind kind = classify_input(input);
    // Everything below ends up in a PyMOL script.
    if (kind != InputKind::ObjFile) {
        if (!chain.empty() && !is_plain_identifier(chain)) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "Invalid chain identifier: " + chain);
        }
        if (kind == InputKind::PdbId && !is_plain_identifier(input)) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "Invalid PDB ID: " + input);
        }
        if (input.find_first_of("\r\n") != std::string::npos) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "Invalid structure path: " + input);
        }
    }

    switch (kind) {
        case InputKind::ObjFile:
            obj_path = input;
            return Result::ok();

        case InputKind::StructureFile: {
            std::error_code ec;
            fs::path abs = fs::canonical(input, ec);
            if (ec) {
                return Result::fail(ErrorCode::FILE_NOT_FOUND, "Structure file not found: " + input);
            }
            Result r = cache_.ensure();
            if (r.failure()) return r;

            obj_path = cache_.local_obj_path(abs.string(), chain);
            std::error_code obj_ec;
            std::error_code src_ec;
            const auto obj_time = fs::last_write_time(obj_path, obj_ec);
            const auto src_time = fs::last_write_time(abs, src_ec);
            if (!obj_ec && !src_ec && obj_time >= src_time) {
                std::cerr << "Using cached structure from " << obj_path << "\n";
                return Result::ok();
            }

            std::cerr << "Generating cartoon with PyMOL...\n";
            return run_pymol(build_load_script(abs.string(), chain, obj_path, options_.cartoon_sampling),
                             obj_path, "PyMOL did not create OBJ file.");
        }

        case InputKind::PdbId: {
            Result r = cache_.ensure();
            if (r.failure()) return r;

            obj_path = cache_.remote_obj_path(input, chain);
            std::error_code ec;
            if (fs::exists(obj_path, ec)) {
                std::cerr << "Using cached structure from " << obj_path << "\n";
                return Result::ok();
            }

            std::cerr << "Fetching " << to_upper(input) << " and generating cartoon with PyMOL...\n";
            r = run_pymol(build_fetch_script(cache_.dir(), input, chain, obj_path, options_.cartoon_sampling),
                          obj_path, "PyMOL did not create OBJ file. Check PDB ID.");
            if (r.failure()) return r;
            std::cerr << "Cached to " << obj_path << "\n";
            return r;
        }
    }
    return Result::fail(ErrorCode::INVALID_ARGUMENT, "Unrecognized input: " + input);
}

}
