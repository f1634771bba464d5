#include "formreg/Types.hpp"

namespace formreg {

const char* statusName(Status s) {
    switch (s) {
    case Status::Ok:         return "ok";
    case Status::NotFound:   return "not found";
    case Status::Degenerate: return "degenerate";
    }
    return "unknown";
}

}
