#ifndef AGENTWIRE_VERSION_HPP
#define AGENTWIRE_VERSION_HPP

#include <string>

namespace agentwire
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace agentwire

#endif // AGENTWIRE_VERSION_HPP
