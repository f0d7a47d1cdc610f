#include "proto/validate.hpp"

#include <variant>

namespace peerwire::proto {

auto validate(const Message& msg, const Geometry& geometry)
  -> tl::expected<Message, Error>
{
    auto validity = std::visit(
      [&geometry](const auto& payload) -> Validity {
          if constexpr (requires { payload.validate(geometry); }) {
              return payload.validate(geometry);
          }
          else {
              return {};
          }
      },
      msg.payload()
    );

    return validity.map([&msg] { return msg; });
}

}  // namespace peerwire::proto
