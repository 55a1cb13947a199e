#include "mailcache/generic_exception.hpp"

nlohmann::json GenericException::toJSON() {
    return {
        {"what", what()},
    };
}
