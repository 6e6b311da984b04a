#pragma once

// Standard library headers
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <map>
#include <fstream>
#include <sstream>
#include <chrono>
#include <mutex>
#include <functional>
#include <algorithm>
#include <utility>
#include <optional>
#include <stdexcept>
#include <cassert>
#include <cmath>
#include <limits>
#include <filesystem>

// Third-party headers (stable, never change)
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
