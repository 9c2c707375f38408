#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace pepterm {

enum class InputKind {
    ObjFile,
    StructureFile,
    PdbId
};

// ".obj" is read directly; ".pdb", ".cif" or anything path-like is a local
// structure; every other token is a PDB identifier.
InputKind classify_input(const std::string& input);

// Non-empty and ASCII letters or digits only.
bool is_plain_identifier(const std::string& text);

struct CacheInfo {
    size_t files = 0;
    uint64_t bytes = 0;
};

// Directory of generated OBJ meshes keyed by structure and chain.
class StructureCache {
public:
    explicit StructureCache(std::string dir = default_dir());

    static std::string default_dir();
    const std::string& dir() const { return dir_; }

    Result ensure() const;
    Result info(CacheInfo& out) const;
    Result clear(size_t& removed) const;

    std::string remote_obj_path(const std::string& pdb_id, const std::string& chain) const;
    std::string local_obj_path(const std::string& structure_path, const std::string& chain) const;
    std::string script_path() const;

private:
    std::string dir_;
};

std::string selection_commands(const std::string& chain);
std::string build_fetch_script(const std::string& fetch_dir, const std::string& pdb_id,
                               const std::string& chain, const std::string& obj_path, int sampling);
std::string build_load_script(const std::string& structure_path, const std::string& chain,
                              const std::string& obj_path, int sampling);

// Turns a CLI input into an OBJ path, running PyMOL in batch mode for
// structures that are not already meshes.
class CartoonSource {
public:
    struct Options {
        std::string pymol_path = "pymol";
        int cartoon_sampling = 3;
    };

    CartoonSource(const Options& options, StructureCache cache);

    Result resolve(const std::string& input, const std::string& chain, std::string& obj_path) const;

    // Absolute path of the PyMOL executable, or empty when it cannot be found.
    std::string find_pymol() const;

private:
    Options options_;
    StructureCache cache_;

    Result run_pymol(const std::string& script, const std::string& obj_path,
                     const std::string& missing_output) const;
};

}
