// ReactiveObserver – Beobachter-Schnittstelle für den EventBus.
// Implementierungen werden als shared_ptr registriert, der Bus hält nur weak_ptr.
#pragma once
#include "Event.h"

class ReactiveObserver {
public:
    virtual ~ReactiveObserver() = default;
    virtual void onEvent(const Event& ev) = 0;
};
