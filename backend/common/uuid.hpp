#pragma once

#include <string>

namespace common {

// Random (v4) uuid in its canonical 36 character form.
std::string generateUuid();

}
