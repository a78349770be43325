#ifndef CODCTL_H
#define CODCTL_H

#include <string_view>

namespace codctl {

constexpr auto VERSION     = std::string_view{ "1.0.0" };
constexpr auto CLIENT_NAME = std::string_view{ "codctl" };

} // namespace codctl

#endif // CODCTL_H
