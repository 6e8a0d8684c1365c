#include "core/DataStructs.hpp"

namespace MiteSeq {

std::string Snv::to_string() const {
    std::string result = std::to_string(ref_index + 1);
    result += ':';
    result += ref_call;
    result += '>';
    result += variant_call;
    return result;
}

}  // namespace MiteSeq
