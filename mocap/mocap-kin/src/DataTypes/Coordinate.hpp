#ifndef MOCAP_KIN_COORDINATE_HPP
#define MOCAP_KIN_COORDINATE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

#include "mocap-kin/src/DataTypes/ComponentFormatterBase.hpp"

namespace mocap_kin
{
namespace detail
{

/**
 * @brief CRTP base class for 3D vector types
 *
 * Inherits from Eigen::Vector3d so every Eigen expression works directly on
 * the derived type. Derived types should use this as:
 *
 *   struct MyVec3Type : Vec3Base<MyVec3Type> { ... };
 *
 * @tparam Derived The derived type (CRTP pattern)
 */
template <typename Derived>
class Vec3Base : public Eigen::Vector3d
{
public:
  static inline constexpr Eigen::Index X = 0;
  static inline constexpr Eigen::Index Y = 1;
  static inline constexpr Eigen::Index Z = 2;

  Vec3Base() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3Base(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3Base(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3Base(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Derived& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return static_cast<Derived&>(*this);
  }
};

}  // namespace detail

/**
 * @brief A 3D position in the tracking frame (metres)
 *
 * Used for joint positions, root-relative joint vectors, bind-pose offsets and
 * reconstructed positions.
 */
struct Coordinate : detail::Vec3Base<Coordinate>
{
  using Vec3Base::Vec3Base;
  using Vec3Base::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3Base{other}
  {
  }
};

}  // namespace mocap_kin

// NOLINTEND(bugprone-crtp-constructor-accessibility)

template <>
struct fmt::formatter<mocap_kin::Coordinate>
  : mocap_kin::detail::ComponentFormatterBase<mocap_kin::Coordinate>
{
  auto format(const mocap_kin::Coordinate& coord, fmt::format_context& ctx) const
  {
    return formatComponents(
      std::array<double, 3>{coord.x(), coord.y(), coord.z()}, ctx);
  }
};

#endif  // MOCAP_KIN_COORDINATE_HPP
