#pragma once
#include <memory>
#include <string>
#include <vector>
#include "exec/broker.hpp"
#include "report/stats.hpp"

namespace ui {

struct ViewerData {
    std::string title{"Backtest"};
    report::Stats stats;
    std::vector<exec::Trade> trades;
    std::vector<exec::EquityPoint> equity; // napi újramintavételezett
};

// Eredmény ablak (SFML + ImGui). run() az ablak bezárásáig blokkol.
class ResultViewer {
public:
    explicit ResultViewer(ViewerData data);
    ~ResultViewer();

    void run();

private:
    struct Impl;
    std::unique_ptr<Impl> self;
};

} // namespace ui
