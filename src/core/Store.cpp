#include "livestore/Store.hpp"
#include "livestore/util/Config.hpp"

#include <utility>

namespace livestore {

StoreOptions StoreOptions::fromConfig(const util::Config& cfg, std::string name) {
  StoreOptions o;
  o.name = std::move(name);
  o.callTimeout = std::chrono::milliseconds(cfg.callTimeoutMs > 0 ? cfg.callTimeoutMs : 1);
  return o;
}

StoreHandle StoreHandle::create(rt::ThreadPool& pool, Assigns initial, const StoreOptions& opts) {
  return StoreHandle(std::make_shared<StoreActor>(pool, std::move(initial), opts));
}

StoreHandle StoreHandle::create(rt::ThreadPool& pool, const AssignList& initial,
                                const StoreOptions& opts) {
  return create(pool, toAssigns(initial), opts);
}

StoreHandle StoreHandle::create(rt::ThreadPool& pool,
                                std::initializer_list<AssignList::value_type> initial,
                                const StoreOptions& opts) {
  return create(pool, AssignList(initial), opts);
}

Value StoreHandle::get(const Key& key, const Value& def) const {
  return actor_->get(key, def);
}

Assigns StoreHandle::take(const std::vector<Key>& keys) const {
  return actor_->take(keys);
}

StoreHandle StoreHandle::assign(const Key& key, Value value) const {
  return assign(AssignList{{key, std::move(value)}});
}

StoreHandle StoreHandle::assign(Assigns attrs) const {
  actor_->assign(std::move(attrs));
  return *this;
}

StoreHandle StoreHandle::assign(AssignList attrs) const {
  actor_->assign(std::move(attrs));
  return *this;
}

StoreHandle StoreHandle::assign(std::initializer_list<AssignList::value_type> attrs) const {
  return assign(AssignList(attrs));
}

StoreHandle StoreHandle::update(const Key& key, UpdateFn fn) const {
  actor_->update(key, std::move(fn));
  return *this;
}

StoreHandle StoreHandle::subscribe(const ObserverRef& observer, const std::vector<Key>& keys) const {
  actor_->subscribe(observer, keys);
  return *this;
}

void StoreHandle::stop(std::string reason) const {
  actor_->stop(std::move(reason));
}

void StoreHandle::monitor(StoreActor::MonitorFn fn) const {
  actor_->monitor(std::move(fn));
}

} // namespace livestore
