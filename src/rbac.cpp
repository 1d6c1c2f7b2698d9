#include "pine/rbac.hpp"

#include <sstream>

namespace pine {
namespace rbac {

// ---------------------------------------------------------------------------
// role_from_string / role_to_string
// ---------------------------------------------------------------------------

std::optional<Role> role_from_string(const std::string& s) {
  if (s == "viewer")        return Role::viewer;
  if (s == "data_ingester") return Role::data_ingester;
  if (s == "operator")      return Role::operator_;
  if (s == "admin")         return Role::admin;
  if (s == "super_admin")   return Role::super_admin;
  return std::nullopt;
}

std::string role_to_string(Role r) {
  switch (r) {
    case Role::viewer:        return "viewer";
    case Role::data_ingester: return "data_ingester";
    case Role::operator_:     return "operator";
    case Role::admin:         return "admin";
    case Role::super_admin:   return "super_admin";
  }
  return "unknown";
}

std::string permission_to_string(Permission p) {
  switch (p) {
    case Permission::add_application:    return "add_application";
    case Permission::remove_application: return "remove_application";
    case Permission::capture_events:     return "capture_events";
    case Permission::modify_metrics:     return "modify_metrics";
    case Permission::configure_system:   return "configure_system";
    case Permission::view_data:          return "view_data";
    case Permission::manage_roles:       return "manage_roles";
    case Permission::control_ingestion:  return "control_ingestion";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// role_has_permission: static role → permission matrix
// ---------------------------------------------------------------------------
// Matrix interpretation:
//   Permission requires a minimum role level.
//   A role satisfies a permission if role >= minimum_required_role.
// ---------------------------------------------------------------------------

struct PermissionRule {
  Permission perm;
  Role       minimum_role;
};

static const PermissionRule kPermissionTable[] = {
  { Permission::view_data,          Role::viewer },
  { Permission::capture_events,     Role::data_ingester },
  { Permission::add_application,    Role::operator_ },
  { Permission::remove_application, Role::operator_ },
  { Permission::modify_metrics,     Role::admin },
  { Permission::manage_roles,       Role::admin },
  { Permission::control_ingestion,  Role::admin },
  { Permission::configure_system,   Role::super_admin },
};

bool role_has_permission(Role role, Permission permission) {
  const uint8_t role_level = static_cast<uint8_t>(role);
  for (const auto& rule : kPermissionTable) {
    if (rule.perm == permission) {
      return role_level >= static_cast<uint8_t>(rule.minimum_role);
    }
  }
  return role == Role::super_admin;
}

std::vector<Permission> permissions_for(Role role) {
  static constexpr Permission kAll[] = {
    Permission::add_application, Permission::remove_application,
    Permission::capture_events,  Permission::modify_metrics,
    Permission::configure_system, Permission::view_data,
    Permission::manage_roles,    Permission::control_ingestion,
  };
  std::vector<Permission> out;
  for (Permission p : kAll) {
    if (role_has_permission(role, p)) out.push_back(p);
  }
  return out;
}

// ---------------------------------------------------------------------------
// RbacState
// ---------------------------------------------------------------------------

RbacState::RbacState(const Owner& super_admin) : super_admin_(super_admin) {
  roles_[super_admin] = Role::super_admin;
}

Role RbacState::get_role(const Owner& owner) const {
  auto it = roles_.find(owner);
  return it == roles_.end() ? Role::viewer : it->second;
}

Status RbacState::assign_role(const Owner& owner, Role role) {
  if (super_admin_ && *super_admin_ == owner && role != Role::super_admin) {
    return Status::failure(ErrorCode::cannot_demote_super_admin,
                           "cannot demote the super admin");
  }
  roles_[owner] = role;
  return Status::success();
}

Status RbacState::remove_role(const Owner& owner) {
  if (super_admin_ && *super_admin_ == owner) {
    return Status::failure(ErrorCode::cannot_demote_super_admin,
                           "cannot demote the super admin");
  }
  roles_.erase(owner);
  return Status::success();
}

bool RbacState::has_permission(const Owner& owner, Permission permission) const {
  return role_has_permission(get_role(owner), permission);
}

bool RbacState::can_manage(const Owner& caller, const Owner& target) const {
  const Role caller_role = get_role(caller);
  if (caller_role == Role::super_admin) return true;
  if (caller_role == Role::admin) return get_role(target) < Role::admin;
  return false;
}

RbacContext RbacState::check(const Owner& owner, Permission permission) const {
  RbacContext ctx;
  ctx.owner = owner;
  ctx.role  = get_role(owner);

  if (role_has_permission(ctx.role, permission)) {
    ctx.ok = true;
  } else {
    ctx.ok            = false;
    ctx.denial_reason = "role '" + role_to_string(ctx.role) +
                        "' lacks permission '" + permission_to_string(permission) + "'";
  }
  return ctx;
}

jsonlite::Value RbacState::to_value() const {
  jsonlite::Object o;
  jsonlite::Object roles;
  for (const auto& [owner, role] : roles_) roles[owner] = jsonlite::Value{role_to_string(role)};
  o["roles"] = jsonlite::Value{std::move(roles)};
  o["super_admin"] = super_admin_ ? jsonlite::Value{*super_admin_} : jsonlite::Value{nullptr};
  return jsonlite::Value{std::move(o)};
}

std::optional<RbacState> RbacState::from_value(const jsonlite::Value& v) {
  const auto* o = std::get_if<jsonlite::Object>(&v.v);
  if (!o) return std::nullopt;
  RbacState s;
  if (const auto* roles = jsonlite::get_object(*o, "roles")) {
    for (const auto& [owner, role_v] : *roles) {
      const auto* name = std::get_if<std::string>(&role_v.v);
      if (!name) return std::nullopt;
      auto role = role_from_string(*name);
      if (!role) return std::nullopt;
      s.roles_[owner] = *role;
    }
  }
  if (auto it = o->find("super_admin"); it != o->end()) {
    if (const auto* sa = std::get_if<std::string>(&it->second.v)) {
      s.super_admin_ = *sa;
      // The designated super admin always holds the role.
      if (s.get_role(*sa) != Role::super_admin) return std::nullopt;
    }
  }
  return s;
}

// ---------------------------------------------------------------------------
// RbacContext::to_json
// ---------------------------------------------------------------------------

std::string RbacContext::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"ok\":" << (ok ? "true" : "false")
    << ",\"owner\":\"" << jsonlite::escape(owner) << "\""
    << ",\"role\":\"" << role_to_string(role) << "\"";
  if (!denial_reason.empty()) {
    o << ",\"denial_reason\":\"" << denial_reason << "\"";
  }
  o << "}";
  return o.str();
}

}  // namespace rbac
}  // namespace pine
