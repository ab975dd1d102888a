#include "reposcope/types.hpp"

namespace reposcope::engine {

    const char* to_string(ChunkType type) {
        switch (type) {
            case ChunkType::Function: return "function";
            case ChunkType::Class:    return "class";
            case ChunkType::Module:   return "module";
            case ChunkType::Comment:  return "comment";
            case ChunkType::Mixed:    return "mixed";
        }
        return "mixed";
    }

    ChunkType chunk_type_from_string(const std::string& name) {
        if (name == "function") return ChunkType::Function;
        if (name == "class") return ChunkType::Class;
        if (name == "module") return ChunkType::Module;
        if (name == "comment") return ChunkType::Comment;
        return ChunkType::Mixed;
    }

}
