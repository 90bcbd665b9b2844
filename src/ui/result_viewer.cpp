#include "ui/result_viewer.hpp"
#include "core/timeutil.hpp"
#include <SFML/Graphics.hpp>
#include <imgui.h>
#include <imgui-SFML.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace ui {

struct ResultViewer::Impl {
    sf::RenderWindow window;
    ViewerData data;
    std::vector<float> eq;
    float eq_min{0}, eq_max{0};

    explicit Impl(ViewerData d)
    : window(sf::VideoMode(1280, 900), d.title), data(std::move(d)) {
        window.setFramerateLimit(60);
        eq.reserve(data.equity.size());
        for (const auto& p : data.equity) eq.push_back((float)p.equity);
        if (!eq.empty()){
            auto [mn,mx] = std::minmax_element(eq.begin(), eq.end());
            eq_min = *mn; eq_max = *mx;
        }
    }
};

ResultViewer::ResultViewer(ViewerData data): self(std::make_unique<Impl>(std::move(data))){
    if (!ImGui::SFML::Init(self->window)) spdlog::warn("ImGui-SFML init failed");
}

ResultViewer::~ResultViewer(){
    ImGui::SFML::Shutdown();
}

void ResultViewer::run(){
    sf::Clock delta;
    bool running=true;
    while (running){
        sf::Event ev{};
        while (self->window.pollEvent(ev)){
            ImGui::SFML::ProcessEvent(self->window, ev);
            if (ev.type==sf::Event::Closed) running=false;
        }
        ImGui::SFML::Update(self->window, delta.restart());

        // --- Stats
        if (ImGui::Begin("Stats")){
            if (ImGui::BeginTable("stats", 2, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)){
                for (const auto& [k, v] : report::stats_rows(self->data.stats)){
                    ImGui::TableNextRow();
                    ImGui::TableSetColumnIndex(0); ImGui::TextUnformatted(k.c_str());
                    ImGui::TableSetColumnIndex(1); ImGui::TextUnformatted(v.c_str());
                }
                ImGui::EndTable();
            }
        }
        ImGui::End();

        // --- Equity (napi)
        if (ImGui::Begin("Equity")){
            ImGui::Text("Final: %.2f  Peak: %.2f  MaxDD: %.2f%%",
                        self->data.stats.equity_final, self->data.stats.equity_peak, self->data.stats.max_drawdown_pct);
            if (!self->eq.empty())
                ImGui::PlotLines("##equity", self->eq.data(), (int)self->eq.size(), 0, nullptr,
                                 self->eq_min, self->eq_max, ImVec2(-1, 320));
        }
        ImGui::End();

        // --- Trades
        if (ImGui::Begin("Trades")){
            if (ImGui::BeginTable("trades", 7, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_SizingStretchProp | ImGuiTableFlags_ScrollY)){
                ImGui::TableSetupColumn("Entry"); ImGui::TableSetupColumn("Exit"); ImGui::TableSetupColumn("Size");
                ImGui::TableSetupColumn("Entry px"); ImGui::TableSetupColumn("Exit px"); ImGui::TableSetupColumn("PnL %");
                ImGui::TableSetupColumn("Reason");
                ImGui::TableHeadersRow();
                for (const auto& t : self->data.trades){
                    ImGui::TableNextRow();
                    ImGui::TableSetColumnIndex(0); ImGui::TextUnformatted(format_utc(t.entry_time_ms).c_str());
                    ImGui::TableSetColumnIndex(1); ImGui::TextUnformatted(format_utc(t.exit_time_ms).c_str());
                    ImGui::TableSetColumnIndex(2); ImGui::Text("%.4f", t.size);
                    ImGui::TableSetColumnIndex(3); ImGui::Text("%.2f", t.entry_price);
                    ImGui::TableSetColumnIndex(4); ImGui::Text("%.2f", t.exit_price);
                    ImGui::TableSetColumnIndex(5); ImGui::Text("%.2f", t.return_pct);
                    ImGui::TableSetColumnIndex(6); ImGui::TextUnformatted(exec::to_string(t.reason));
                }
                ImGui::EndTable();
            }
        }
        ImGui::End();

        // --- Render
        self->window.clear();
        ImGui::SFML::Render(self->window);
        self->window.display();
    }
    self->window.close();
}

} // namespace ui
