/**
 * @file errors.cpp
 * @brief Human-readable rendering of TypesError.
 */
#include "podcfg/types/errors.hpp"

namespace podcfg::types {

std::string describe(const TypesError& err) {
    switch (err.code) {
        case TypesErr::UnknownSource:
            return "unknown pod source \"" + err.subject + "\"";
        case TypesErr::SourceUnknown:
            return "cannot get source of pod \"" + err.subject + "\"";
    }
    return "unknown error";
}

} // namespace podcfg::types
