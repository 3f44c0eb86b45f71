#include "debug.hpp"
#include "../debug_panel.hpp"
#include "../diagnostics.hpp"
#include <raylib.h>
#include <string>

static constexpr int   PAD      = 8;
static constexpr int   PANEL_W  = 300;
static constexpr int   ROW_H    = 15;
static constexpr int   FONT_SM  = 10;
static constexpr int   FONT_MD  = 11;
static constexpr int   LABEL_W  = 120;  // content-left to value column
static constexpr Color BG       = {20,  20,  20,  210};
static constexpr Color DIVIDER  = {80,  80,  80,  200};
static constexpr Color C_TITLE  = {160, 160, 160, 255};
static constexpr Color C_HEADER = {210, 190, 80,  255};
static constexpr Color C_LABEL  = {180, 180, 180, 255};
static constexpr Color C_VALUE  = {255, 255, 255, 255};
static constexpr Color C_LOG    = {230, 140, 110, 255};

static int section_header(const char* title, int ox, int cy) {
    DrawLine(ox + PAD, cy, ox + PANEL_W - PAD, cy, DIVIDER);
    cy += 4;
    DrawText(title, ox + PAD, cy, FONT_MD, C_HEADER);
    return cy + ROW_H;
}

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (IsKeyPressed(KEY_F3)) panel->visible = !panel->visible;
    if (!panel->visible) return;

    const auto& sections = panel->sections();
    const auto* diagnostics = world.try_resource<Diagnostics>();
    const int log_rows = diagnostics ? static_cast<int>(diagnostics->recent().size()) : 0;

    int rows_total = 0;
    for (const auto& s : sections) rows_total += 1 + static_cast<int>(s.rows.size());
    int separators = static_cast<int>(sections.size());
    if (log_rows > 0) {
        rows_total += 1 + log_rows;
        ++separators;
    }

    const int title_area = ROW_H + PAD;
    const int panel_h    = PAD + title_area + rows_total * ROW_H + separators * 4 + PAD;

    const int ox = 10, oy = 10;
    DrawRectangle(ox, oy, PANEL_W, panel_h, BG);
    DrawRectangleLines(ox, oy, PANEL_W, panel_h, DIVIDER);

    int cy = oy + PAD;
    DrawText("DEBUG", ox + PAD, cy, FONT_MD, C_TITLE);
    DrawText("[F3]", ox + PANEL_W - PAD - MeasureText("[F3]", FONT_SM) - 2, cy + 1, FONT_SM, DIVIDER);
    cy += ROW_H + PAD;

    for (const auto& sec : sections) {
        cy = section_header(sec.title.c_str(), ox, cy);
        for (const auto& row : sec.rows) {
            const std::string val = row.fn ? row.fn() : std::string("-");
            DrawText(row.label.c_str(), ox + PAD + 4, cy, FONT_SM, C_LABEL);
            DrawText(val.c_str(),       ox + PAD + 4 + LABEL_W, cy, FONT_SM, C_VALUE);
            cy += ROW_H;
        }
    }

    if (log_rows > 0) {
        cy = section_header("Log", ox, cy);
        for (const auto& line : diagnostics->recent()) {
            DrawText(line.c_str(), ox + PAD + 4, cy, FONT_SM, C_LOG);
            cy += ROW_H;
        }
    }
}
