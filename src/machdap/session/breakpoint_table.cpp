#include "breakpoint_table.hpp"

#include <algorithm>

namespace machdap::session {

void breakpoint_table::arm() {
  if (armed_) {
    return;
  }
  armed_ = true;
  for (auto& [address, entry] : sites_) {
    if (!entry.inserted && sink_) {
      sink_(rsp::make_insert_breakpoint(address, breakpoint_kind_, address));
      entry.inserted = true;
    }
  }
  log_.dbg("armed", redlog::field("sites", sites_.size()));
}

void breakpoint_table::disarm() {
  armed_ = false;
  for (auto& [address, entry] : sites_) {
    entry.inserted = false;
  }
}

void breakpoint_table::acquire_site(uint64_t address) {
  site& entry = sites_[address];
  entry.references += 1;
  if (entry.references == 1 && armed_ && sink_) {
    log_.vrb("inserting site", redlog::field("address", "0x%016llx", address));
    sink_(rsp::make_insert_breakpoint(address, breakpoint_kind_, address));
    entry.inserted = true;
  }
}

void breakpoint_table::release_site(uint64_t address) {
  auto it = sites_.find(address);
  if (it == sites_.end()) {
    return;
  }
  if (it->second.references > 1) {
    it->second.references -= 1;
    return;
  }
  if (it->second.inserted && sink_) {
    log_.vrb("removing site", redlog::field("address", "0x%016llx", address));
    sink_(rsp::make_remove_breakpoint(address, breakpoint_kind_, address));
  }
  sites_.erase(it);
}

void breakpoint_table::detach_site(breakpoint& bp) {
  if (bp.state == breakpoint_state::resolved && bp.address) {
    release_site(*bp.address);
  }
  bp.state = breakpoint_state::pending;
  bp.address.reset();
  bp.resolved_line.reset();
  bp.verified = false;
}

void breakpoint_table::resolve_one(breakpoint& bp, const symbols::symbol_store* store) {
  if (bp.origin != breakpoint_origin::source) {
    return;
  }
  std::optional<uint64_t> address;
  if (store && store->loaded()) {
    address = store->resolve_location(bp.source_path, bp.line);
  }
  if (address == bp.address && bp.state == breakpoint_state::resolved) {
    return;
  }

  detach_site(bp);
  if (!address) {
    bp.message = store && store->loaded() ? "no code at this line" : "module not loaded";
    log_.dbg("breakpoint pending", redlog::field("id", bp.id), redlog::field("file", bp.source_path),
             redlog::field("line", bp.line));
    return;
  }

  bp.address = address;
  bp.state = breakpoint_state::resolved;
  bp.verified = true;
  bp.message.clear();
  if (auto location = store->resolve_address(*address)) {
    bp.resolved_line = location->line;
  }
  acquire_site(*address);
  log_.dbg("breakpoint resolved", redlog::field("id", bp.id), redlog::field("file", bp.source_path),
           redlog::field("line", bp.line), redlog::field("address", "0x%016llx", *address));
}

int breakpoint_table::add(const std::string& path, uint32_t line, const symbols::symbol_store* store) {
  breakpoint bp;
  bp.id = next_id_++;
  bp.origin = breakpoint_origin::source;
  bp.source_path = path;
  bp.line = line;
  resolve_one(bp, store);
  int id = bp.id;
  breakpoints_.emplace(id, std::move(bp));
  return id;
}

bool breakpoint_table::clear(int id) {
  auto it = breakpoints_.find(id);
  if (it == breakpoints_.end()) {
    return false;
  }
  detach_site(it->second);
  breakpoints_.erase(it);
  return true;
}

std::vector<breakpoint> breakpoint_table::set_source_breakpoints(
    const std::string& path, const std::vector<uint32_t>& lines, const symbols::symbol_store* store
) {
  std::map<uint32_t, std::vector<int>> existing;
  for (const auto& [id, bp] : breakpoints_) {
    if (bp.origin == breakpoint_origin::source && bp.source_path == path) {
      existing[bp.line].push_back(id);
    }
  }

  std::vector<int> ordered;
  ordered.reserve(lines.size());
  for (uint32_t line : lines) {
    auto found = existing.find(line);
    if (found != existing.end() && !found->second.empty()) {
      int id = found->second.front();
      found->second.erase(found->second.begin());
      resolve_one(breakpoints_.at(id), store);
      ordered.push_back(id);
    } else {
      ordered.push_back(add(path, line, store));
    }
  }
  for (const auto& [line, ids] : existing) {
    for (int id : ids) {
      clear(id);
    }
  }

  std::vector<breakpoint> out;
  out.reserve(ordered.size());
  for (int id : ordered) {
    out.push_back(breakpoints_.at(id));
  }
  return out;
}

std::vector<breakpoint> breakpoint_table::set_instruction_breakpoints(const std::vector<uint64_t>& addresses) {
  std::map<uint64_t, std::vector<int>> existing;
  for (const auto& [id, bp] : breakpoints_) {
    if (bp.origin == breakpoint_origin::instruction && bp.address) {
      existing[*bp.address].push_back(id);
    }
  }

  std::vector<int> ordered;
  ordered.reserve(addresses.size());
  for (uint64_t address : addresses) {
    auto found = existing.find(address);
    if (found != existing.end() && !found->second.empty()) {
      ordered.push_back(found->second.front());
      found->second.erase(found->second.begin());
      continue;
    }
    breakpoint bp;
    bp.id = next_id_++;
    bp.origin = breakpoint_origin::instruction;
    bp.address = address;
    bp.state = breakpoint_state::resolved;
    bp.verified = true;
    acquire_site(address);
    ordered.push_back(bp.id);
    breakpoints_.emplace(bp.id, std::move(bp));
  }
  for (const auto& [address, ids] : existing) {
    for (int id : ids) {
      clear(id);
    }
  }

  std::vector<breakpoint> out;
  out.reserve(ordered.size());
  for (int id : ordered) {
    out.push_back(breakpoints_.at(id));
  }
  return out;
}

std::vector<breakpoint> breakpoint_table::resolve(const symbols::symbol_store& store) {
  std::vector<breakpoint> changed;
  for (auto& [id, bp] : breakpoints_) {
    if (bp.origin != breakpoint_origin::source) {
      continue;
    }
    std::optional<uint64_t> before = bp.address;
    bool was_verified = bp.verified;
    resolve_one(bp, &store);
    if (bp.address != before || bp.verified != was_verified) {
      changed.push_back(bp);
    }
  }
  return changed;
}

std::vector<breakpoint> breakpoint_table::unresolve() {
  std::vector<breakpoint> changed;
  for (auto& [id, bp] : breakpoints_) {
    if (bp.origin == breakpoint_origin::source && bp.state == breakpoint_state::resolved) {
      detach_site(bp);
      bp.message = "module not loaded";
      changed.push_back(bp);
    }
  }
  return changed;
}

std::vector<breakpoint> breakpoint_table::mark_insert_failed(uint64_t address, const std::string& message) {
  std::vector<breakpoint> changed;
  auto it = sites_.find(address);
  if (it != sites_.end()) {
    it->second.inserted = false;
  }
  for (auto& [id, bp] : breakpoints_) {
    if (bp.address == address && bp.verified) {
      bp.verified = false;
      bp.message = message;
      changed.push_back(bp);
    }
  }
  log_.wrn("stub rejected breakpoint", redlog::field("address", "0x%016llx", address),
           redlog::field("breakpoints", changed.size()));
  return changed;
}

void breakpoint_table::acquire_temporary(uint64_t address) { acquire_site(address); }

void breakpoint_table::release_temporary(uint64_t address) { release_site(address); }

void breakpoint_table::release_all() {
  for (const auto& [address, entry] : sites_) {
    if (entry.inserted && armed_ && sink_) {
      sink_(rsp::make_remove_breakpoint(address, breakpoint_kind_, address));
    }
  }
  sites_.clear();
  breakpoints_.clear();
}

const breakpoint* breakpoint_table::find(int id) const {
  auto it = breakpoints_.find(id);
  return it == breakpoints_.end() ? nullptr : &it->second;
}

std::vector<int> breakpoint_table::breakpoints_at(uint64_t address) const {
  std::vector<int> ids;
  for (const auto& [id, bp] : breakpoints_) {
    if (bp.address == address && bp.state == breakpoint_state::resolved) {
      ids.push_back(id);
    }
  }
  return ids;
}

std::vector<breakpoint> breakpoint_table::all() const {
  std::vector<breakpoint> out;
  out.reserve(breakpoints_.size());
  for (const auto& [id, bp] : breakpoints_) {
    out.push_back(bp);
  }
  return out;
}

size_t breakpoint_table::site_references(uint64_t address) const {
  auto it = sites_.find(address);
  return it == sites_.end() ? 0 : it->second.references;
}

} // namespace machdap::session
