#include "uuid.hpp"
#include <uuid/uuid.h>

namespace common {

std::string generateUuid() {
  uuid_t uuid;
  uuid_generate_random(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

}
