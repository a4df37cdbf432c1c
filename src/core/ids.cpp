#include "fcat/core/ids.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>
#include <stdexcept>

namespace fcat::core {
namespace {

constexpr std::size_t kCanonicalLength = 36;

} // namespace

std::string generate_id() {
    // random_generator is not thread-safe; one shared instance behind a lock
    static boost::uuids::random_generator generator;
    static std::mutex mutex;

    boost::uuids::uuid id;
    {
        std::lock_guard lock(mutex);
        id = generator();
    }
    return boost::uuids::to_string(id);
}

bool is_valid_id(std::string_view candidate) {
    if (candidate.size() != kCanonicalLength) {
        return false;
    }
    for (std::size_t i = 0; i < candidate.size(); ++i) {
        const bool dash_slot = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_slot != (candidate[i] == '-')) {
            return false;
        }
    }
    try {
        boost::uuids::string_generator parse;
        parse(std::string(candidate));
    } catch (const std::runtime_error&) {
        return false;
    }
    return true;
}

} // namespace fcat::core
