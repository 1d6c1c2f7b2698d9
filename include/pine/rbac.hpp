#pragma once

// pine/rbac.hpp: Role-Based Access Control for pine.
//
// DESIGN:
//   Every mutating operation names the permission it needs. The operation
//   layer calls check() with the caller's identity before touching state.
//   Queries are not gated.
//
// ROLES (ordered by privilege, ascending):
//   viewer       : read-only access.
//   data_ingester: viewer + event submission.
//   operator     : data_ingester + monitored application management.
//   admin        : operator + metrics, role management, ingestion control.
//   super_admin  : everything, including system configuration.
//
// INVARIANTS:
//   - An identity with no assignment is a viewer.
//   - The designated super admin can never be assigned another role or have
//     its assignment removed.
//   - Permission sets are monotonic in the role order: a higher role holds
//     every permission of every lower role.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pine/types.hpp"

namespace pine {
namespace rbac {

// ---------------------------------------------------------------------------
// Role: ordered privilege levels (viewer=0 < ... < super_admin=4)
// ---------------------------------------------------------------------------
enum class Role : uint8_t {
  viewer        = 0,
  data_ingester = 1,
  operator_     = 2,  // trailing underscore avoids C++ keyword conflict
  admin         = 3,
  super_admin   = 4,
};

// Parse role from string. Returns nullopt on unrecognized value.
std::optional<Role> role_from_string(const std::string& s);

// Serialize role to canonical string.
std::string role_to_string(Role r);

// ---------------------------------------------------------------------------
// Permission
// ---------------------------------------------------------------------------
enum class Permission {
  add_application,     // operator+
  remove_application,  // operator+
  capture_events,      // data_ingester+
  modify_metrics,      // admin+
  configure_system,    // super_admin only
  view_data,           // viewer+
  manage_roles,        // admin+
  control_ingestion,   // admin+
};

std::string permission_to_string(Permission p);

// Pure table lookup. Fail-closed: unknown permission → super_admin only.
bool role_has_permission(Role role, Permission permission);

// Every permission the role holds, in enum order.
std::vector<Permission> permissions_for(Role role);

// ---------------------------------------------------------------------------
// RbacContext: result of an RBAC check
// ---------------------------------------------------------------------------
struct RbacContext {
  bool   ok{false};
  Role   role{Role::viewer};
  Owner  owner;
  std::string denial_reason;  // non-empty if !ok

  // Convenience: returns an audit log-friendly summary.
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// RbacState: identity → role map plus the designated super admin
// ---------------------------------------------------------------------------
class RbacState {
 public:
  RbacState() = default;
  // Seeds the map with super_admin → Role::super_admin.
  explicit RbacState(const Owner& super_admin);

  Role get_role(const Owner& owner) const;

  // cannot_demote_super_admin if owner is the super admin and role differs.
  Status assign_role(const Owner& owner, Role role);

  // cannot_demote_super_admin if owner is the super admin.
  Status remove_role(const Owner& owner);

  bool has_permission(const Owner& owner, Permission permission) const;

  // super_admin manages anyone; admin manages operator, data_ingester and
  // viewer; nobody else manages anyone.
  bool can_manage(const Owner& caller, const Owner& target) const;

  // Evaluates has_permission for owner. Never throws.
  RbacContext check(const Owner& owner, Permission permission) const;

  const std::optional<Owner>& super_admin() const { return super_admin_; }
  const std::map<Owner, Role>& roles() const { return roles_; }

  jsonlite::Value to_value() const;
  static std::optional<RbacState> from_value(const jsonlite::Value& v);

 private:
  std::map<Owner, Role> roles_;
  std::optional<Owner> super_admin_;
};

}  // namespace rbac
}  // namespace pine
