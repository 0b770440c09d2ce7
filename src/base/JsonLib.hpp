#ifndef __RX_JSON_LIB__
#define __RX_JSON_LIB__

#include "nlohmann/json.hpp"

using json = nlohmann::json;

#endif  // __RX_JSON_LIB__
