// Copyright (c) 2024 liudegui. MIT License.
//
// property_changed_demo.cpp -- observable model with a multicast
// PropertyChanged event.
//
// The model owns a Handler<PropertyChangedEventArgs>. Views written against
// the base EventArgs are adapted contravariantly, and the whole list is made
// resilient so a broken view cannot stop the others from updating.

#include "evr/evr.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

// ============================================================================
// Model
// ============================================================================

class Thermostat {
 public:
  using ChangedHandler = evr::Handler<evr::PropertyChangedEventArgs>;

  void Subscribe(const ChangedHandler& h) { property_changed_ = property_changed_ + h; }

  void SetTarget(double celsius) {
    if (celsius == target_) return;
    target_ = celsius;
    Notify("Target");
  }

  void SetMode(std::string mode) {
    if (mode == mode_) return;
    mode_ = std::move(mode);
    Notify("Mode");
  }

  double Target() const { return target_; }
  const std::string& Mode() const { return mode_; }

 private:
  void Notify(const char* property) {
    auto safe = evr::Resilient(property_changed_, [](const evr::Callback<evr::PropertyChangedEventArgs>& cb,
                                                     std::exception_ptr fault) {
      EVR_LOG_WARN("Thermostat", "view %p failed: %s", cb.Receiver(), evr::DescribeFault(fault).c_str());
    });
    evr::Raise(safe, this, evr::PropertyChangedEventArgs(property));
  }

  ChangedHandler property_changed_;
  double target_ = 20.0;
  std::string mode_ = "auto";
};

// ============================================================================
// Views
// ============================================================================

struct Display {
  void OnChanged(evr::Sender sender, const evr::PropertyChangedEventArgs& args) {
    const auto* t = static_cast<const Thermostat*>(sender);
    printf("  [display] %s -> target=%.1f mode=%s\n", args.property_name.c_str(), t->Target(), t->Mode().c_str());
  }
};

struct AuditTrail {
  void OnAnyEvent(evr::Sender /*sender*/, const evr::EventArgs& /*args*/) { printf("  [audit]   change #%d\n", ++count); }
  int count = 0;
};

struct BrokenWidget {
  void OnChanged(evr::Sender /*sender*/, const evr::PropertyChangedEventArgs& args) {
    if (args.property_name == "Mode") throw std::runtime_error("widget cannot render mode");
    printf("  [widget]  %s ok\n", args.property_name.c_str());
  }
};

int main() {
  evr::log::Init();

  Thermostat thermostat;
  Display display;
  AuditTrail audit;
  BrokenWidget widget;

  auto on_display = evr::Adapt<evr::PropertyChangedEventArgs>(&display, &Display::OnChanged);
  auto on_widget = evr::Adapt<evr::PropertyChangedEventArgs>(&widget, &BrokenWidget::OnChanged);
  if (!on_display.has_value() || !on_widget.has_value()) {
    EVR_LOG_ERROR("Demo", "view adaptation failed");
    return 1;
  }

  // The audit trail only knows EventArgs; reuse it for the derived event.
  evr::Handler<evr::EventArgs> audit_any = evr::Callback<evr::EventArgs>(&audit, &AuditTrail::OnAnyEvent);

  thermostat.Subscribe(on_display.value());
  thermostat.Subscribe(on_widget.value());
  thermostat.Subscribe(evr::AdaptContravariant<evr::EventArgs, evr::PropertyChangedEventArgs>(audit_any));

  printf("\n=== SetTarget(22.5) ===\n");
  thermostat.SetTarget(22.5);
  printf("\n=== SetMode(\"heat\") ===\n");
  thermostat.SetMode("heat");
  printf("\n=== SetMode(\"heat\") again (no change, no event) ===\n");
  thermostat.SetMode("heat");

  printf("\naudit recorded %d change(s)\n", audit.count);
  evr::log::Shutdown();
  return 0;
}
