// main_vis.cpp
// - Runs one traced trial plus a Monte-Carlo batch on the same scenario
// - Left/right panels: allocator vs. random baseline, zones on a circle,
//   drivers packed around their zone, arrows for the slot's movers
// - Slot slider with play/pause drives both panels off the shared trace
// - Plots: per-slot revenue, cumulative revenue, histograms of trial totals
//   and of the per-trial difference

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include "ExperimentRunner.h"
#include "../data/revenue_csv.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define TAXISIM_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

static const char* kDayNames[7] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

// ============================================================
// Run state shared by the panels and plots
// ============================================================

struct VisRunParams {
    int drivers = 30;
    float hours = 6.0f;
    float alpha = 0.6f;
    int model = 0;  // 0 = saturation, 1 = split
    int trials = 300;
    int seed = 12345;
    int workers = 4;
};

struct VisRunData {
    std::vector<taxisim::SlotRecord> trace;
    taxisim::TrialOutcome trial{};
    taxisim::ExperimentRunner::Result batch{};

    std::vector<double> slot_x;
    std::vector<double> alloc_slot;
    std::vector<double> base_slot;
    std::vector<double> alloc_cum;
    std::vector<double> base_cum;

    std::vector<double> alloc_totals;
    std::vector<double> base_totals;
    std::vector<double> diffs;

    std::string error;
};

static taxisim::ScenarioConfig scenarioFromParams(const VisRunParams& p) {
    taxisim::ScenarioConfig cfg;
    cfg.num_drivers = std::max(0, p.drivers);
    cfg.horizon_h = std::max(0.5, static_cast<double>(p.hours));
    cfg.alpha = static_cast<double>(p.alpha);
    cfg.model = (p.model == 1) ? taxisim::CongestionModel::Split : taxisim::CongestionModel::Saturation;
    return cfg;
}

static void rebuildRun(const taxisim::data::RevenueTable& table, const VisRunParams& p, VisRunData& out) {
    out = VisRunData{};

    const taxisim::ScenarioConfig cfg = scenarioFromParams(p);
    taxisim::ExperimentRunner::ExperimentConfig exp;
    exp.num_trials = p.trials;
    exp.seed = static_cast<std::uint64_t>(p.seed);
    exp.workers = p.workers;

    taxisim::ExperimentRunner runner(table);
    try {
        out.trial = runner.runTrial(cfg, exp.seed, 0, &out.trace);
        out.batch = runner.runExperiment(cfg, exp);
    } catch (const std::invalid_argument& e) {
        out.error = e.what();
        return;
    }

    double ca = 0.0;
    double cb = 0.0;
    for (const auto& rec : out.trace) {
        out.slot_x.push_back(static_cast<double>(rec.slot));
        out.alloc_slot.push_back(rec.allocator.slot_revenue);
        out.base_slot.push_back(rec.baseline.slot_revenue);
        ca += rec.allocator.slot_revenue;
        cb += rec.baseline.slot_revenue;
        out.alloc_cum.push_back(ca);
        out.base_cum.push_back(cb);
    }

    for (const auto& t : out.batch.trials) {
        out.alloc_totals.push_back(t.allocator_total);
        out.base_totals.push_back(t.baseline_total);
        out.diffs.push_back(t.diff());
    }
}

// ============================================================
// Zone map (ImDrawList, 2D)
// ============================================================

static ImVec2 zoneCenter(ImVec2 origin, ImVec2 size, int zone, int num_zones) {
    const float cx = origin.x + size.x * 0.5f;
    const float cy = origin.y + size.y * 0.5f;
    const float r = 0.36f * std::min(size.x, size.y);
    const float ang = (num_zones > 0) ? (6.2831853f * zone / num_zones) - 1.5707963f : 0.0f;
    return ImVec2(cx + r * std::cos(ang), cy + r * std::sin(ang));
}

// Driver i of the zone's occupants sits on a small ring around the zone center.
static ImVec2 driverOffset(int rank, float zone_radius) {
    const int per_ring = 10;
    const int ring = rank / per_ring;
    const float ang = 6.2831853f * (rank % per_ring) / per_ring;
    const float rr = zone_radius + 6.0f + 7.0f * ring;
    return ImVec2(rr * std::cos(ang), rr * std::sin(ang));
}

static void drawArrow(ImDrawList* dl, ImVec2 a, ImVec2 b, ImU32 col) {
    dl->AddLine(a, b, col, 1.5f);
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    const float l = std::sqrt(dx * dx + dy * dy);
    if (l < 1e-3f) return;
    const float ux = dx / l;
    const float uy = dy / l;
    const float head = 8.0f;
    const ImVec2 p1(b.x - head * (ux - 0.5f * uy), b.y - head * (uy + 0.5f * ux));
    const ImVec2 p2(b.x - head * (ux + 0.5f * uy), b.y - head * (uy - 0.5f * ux));
    dl->AddTriangleFilled(b, p1, p2, col);
}

static void drawZoneMap(const char* id,
                        const taxisim::SlotRecord& rec,
                        const taxisim::StrategySlotRecord& s,
                        bool show_arrows,
                        ImVec2 size) {
    ImGui::BeginChild(id, size, true);
    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const ImVec2 avail = ImGui::GetContentRegionAvail();
    const int K = static_cast<int>(rec.revenues.size());

    double max_rev = 0.0;
    for (double v : rec.revenues) max_rev = std::max(max_rev, v);

    std::vector<ImVec2> centers(static_cast<std::size_t>(K));
    for (int k = 0; k < K; ++k) {
        centers[k] = zoneCenter(origin, avail, k, K);
        const float heat = (max_rev > 0.0) ? static_cast<float>(rec.revenues[k] / max_rev) : 0.0f;
        const float radius = 12.0f + 14.0f * heat;
        dl->AddCircleFilled(centers[k], radius, ImGui::GetColorU32(ImVec4(0.15f + 0.7f * heat, 0.35f, 0.25f, 0.9f)), 32);
        dl->AddCircle(centers[k], radius, IM_COL32(200, 200, 200, 255), 32, 1.0f);

        char label[48];
        std::snprintf(label, sizeof(label), "%d: %.1f", k, rec.revenues[k]);
        dl->AddText(ImVec2(centers[k].x - 18.0f, centers[k].y - radius - 34.0f), IM_COL32(230, 230, 230, 255), label);
    }

    std::vector<int> occupancy(static_cast<std::size_t>(K), 0);
    for (std::size_t i = 0; i < s.zones_before.size(); ++i) {
        const int zb = s.zones_before[i];
        const int za = i < s.zones_after.size() ? s.zones_after[i] : zb;
        if (zb < 0 || zb >= K) continue;
        const ImVec2 off = driverOffset(occupancy[zb]++, 12.0f);
        const ImVec2 p(centers[zb].x + off.x, centers[zb].y + off.y);
        const bool moving = (za != zb);
        const ImU32 col = moving ? IM_COL32(255, 190, 40, 255) : IM_COL32(90, 200, 255, 255);
        dl->AddCircleFilled(p, 3.0f, col, 8);
        if (show_arrows && moving && za >= 0 && za < K) {
            drawArrow(dl, p, centers[za], IM_COL32(255, 190, 40, 140));
        }
    }

    ImGui::Dummy(avail);
    ImGui::EndChild();
}

// ============================================================
// Plot helpers
// ============================================================

static void plot_two_lines(const char* title,
                           const std::vector<double>& xs,
                           const std::vector<double>& a,
                           const std::vector<double>& b,
                           double cursor_x) {
    const int count = static_cast<int>(xs.size());
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title, ImVec2(-1, 220))) {
        ImPlot::PlotLine("allocator", xs.data(), a.data(), count);
        ImPlot::PlotLine("baseline", xs.data(), b.data(), count);
        // Current slot marker.
        double lo = 0.0;
        double hi = 0.0;
        for (int i = 0; i < count; ++i) {
            lo = std::min(lo, std::min(a[i], b[i]));
            hi = std::max(hi, std::max(a[i], b[i]));
        }
        const double mx[2] = {cursor_x, cursor_x};
        const double my[2] = {lo, hi};
        ImPlot::PlotLine("slot", mx, my, 2);
        ImPlot::EndPlot();
    }
}

static void plot_histogram(const char* title,
                           const char* label_a, const std::vector<double>& a,
                           const char* label_b, const std::vector<double>* b) {
    if (a.empty())
        return;

    if (ImPlot::BeginPlot(title, ImVec2(-1, 220))) {
        ImPlot::SetNextFillStyle(IMPLOT_AUTO_COL, 0.5f);
        ImPlot::PlotHistogram(label_a, a.data(), static_cast<int>(a.size()), 30);
        if (b && !b->empty()) {
            ImPlot::SetNextFillStyle(IMPLOT_AUTO_COL, 0.5f);
            ImPlot::PlotHistogram(label_b, b->data(), static_cast<int>(b->size()), 30);
        }
        ImPlot::EndPlot();
    }
}

int main(int argc, char** argv) {
    // --- CLI flags ---
    std::string data_path;
    int zones = 6;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--data" && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--zones" && i + 1 < argc) {
            zones = std::atoi(argv[++i]);
        }
    }

    taxisim::data::RevenueTable table;
    try {
        table = data_path.empty() ? taxisim::data::makeSyntheticRevenueTable(zones)
                                  : taxisim::data::loadRevenueCSV(data_path);
    } catch (const std::exception& e) {
        return fail(e.what());
    }
    if (table.zoneCount() <= 0) return fail("revenue table has no zones");

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1400, 860, "Taxi Allocation Visualizer", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef TAXISIM_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    (void)io;

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    VisRunParams params;
    VisRunData run;
    rebuildRun(table, params, run);

    int slot = 0;
    bool playing = false;
    bool show_arrows = true;
    float slots_per_second = 2.0f;
    double accum_s = 0.0;
    double wall_prev = glfwGetTime();

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        const double wall_now = glfwGetTime();
        const double wall_dt = std::clamp(wall_now - wall_prev, 0.0, 0.1);
        wall_prev = wall_now;

        const int last_slot = std::max(0, static_cast<int>(run.trace.size()) - 1);
        if (playing && !run.trace.empty()) {
            accum_s += wall_dt * slots_per_second;
            while (accum_s >= 1.0) {
                accum_s -= 1.0;
                if (slot < last_slot) {
                    ++slot;
                } else {
                    playing = false;
                    accum_s = 0.0;
                }
            }
        }
        slot = std::clamp(slot, 0, last_slot);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef TAXISIM_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        // Controls
        ImGui::Begin("Controls");
        ImGui::Text("Revenue table: %zu rows, %d zones%s", table.size(), table.zoneCount(),
                    data_path.empty() ? " (synthetic)" : "");
        ImGui::Separator();
        ImGui::SliderInt("Drivers", &params.drivers, 0, 200);
        ImGui::SliderFloat("Hours", &params.hours, 0.5f, 24.0f, "%.1f h");
        ImGui::Combo("Model", &params.model, "saturation\0split\0");
        if (params.model == 0) {
            ImGui::SliderFloat("Alpha", &params.alpha, 0.05f, 3.0f, "%.2f");
        }
        ImGui::SliderInt("Trials", &params.trials, 1, 5000);
        ImGui::InputInt("Seed", &params.seed);
        ImGui::SliderInt("Workers", &params.workers, 1, 16);
        if (ImGui::Button("[ RE-RUN ]", ImVec2(-1, 0))) {
            rebuildRun(table, params, run);
            slot = 0;
            playing = false;
            accum_s = 0.0;
        }
        if (!run.error.empty()) {
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "Error: %s", run.error.c_str());
        }

        ImGui::Separator();
        if (ImGui::Button(playing ? "  PAUSE  " : "  PLAY   ", ImVec2(100, 0))) playing = !playing;
        ImGui::SameLine();
        if (ImGui::Button(" RESET ", ImVec2(100, 0))) {
            slot = 0;
            playing = false;
        }
        ImGui::SliderInt("Slot", &slot, 0, last_slot);
        ImGui::SliderFloat("Speed", &slots_per_second, 0.25f, 20.0f, "%.2f slots/s");
        ImGui::Checkbox("Mover arrows", &show_arrows);

        if (!run.trace.empty()) {
            const auto& s = run.batch.summary;
            ImGui::Separator();
            ImGui::Text("Trial 0: allocator %.2f  baseline %.2f", run.trial.allocator_total, run.trial.baseline_total);
            ImGui::Text("%d trials: allocator mean %.2f  baseline mean %.2f", s.num_trials, s.allocator.mean, s.baseline.mean);
            ImGui::Text("Win rate %.1f%%  uplift %+.2f%%", s.win_rate * 100.0, s.uplift_pct);
            ImGui::Text("Run hash %08x", s.run_param_hash_u32);
        }
        ImGui::End();

        // Zone maps
        ImGui::Begin("Zones");
        if (!run.trace.empty()) {
            const auto& rec = run.trace[static_cast<std::size_t>(slot)];
            const int day = std::clamp(rec.context.day, 0, 6);
            ImGui::Text("Slot %d / %d   %s %05.2f h   weather %s", rec.slot + 1, static_cast<int>(run.trace.size()),
                        kDayNames[day], rec.context.time_h, rec.context.weather.c_str());

            const ImVec2 avail = ImGui::GetContentRegionAvail();
            const ImVec2 half(avail.x * 0.5f - 4.0f, std::max(200.0f, avail.y - 48.0f));

            ImGui::BeginGroup();
            ImGui::Text("Allocator  active %d  stay %d  move %d  revenue %.2f", rec.allocator.active_count,
                        rec.allocator.stayer_count, rec.allocator.mover_count, rec.allocator.slot_revenue);
            drawZoneMap("##alloc_map", rec, rec.allocator, show_arrows, half);
            ImGui::EndGroup();
            ImGui::SameLine();
            ImGui::BeginGroup();
            ImGui::Text("Baseline  active %d  stay %d  move %d  revenue %.2f", rec.baseline.active_count,
                        rec.baseline.stayer_count, rec.baseline.mover_count, rec.baseline.slot_revenue);
            drawZoneMap("##base_map", rec, rec.baseline, show_arrows, half);
            ImGui::EndGroup();
        }
        ImGui::End();

        // Plots
        ImGui::Begin("Revenue");
        plot_two_lines("Slot revenue", run.slot_x, run.alloc_slot, run.base_slot, static_cast<double>(slot));
        plot_two_lines("Cumulative revenue", run.slot_x, run.alloc_cum, run.base_cum, static_cast<double>(slot));
        plot_histogram("Trial totals", "allocator", run.alloc_totals, "baseline", &run.base_totals);
        plot_histogram("Allocator - baseline", "diff", run.diffs, nullptr, nullptr);
        ImGui::End();

        ImGui::Render();

        int display_w = 0, display_h = 0;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.08f, 0.08f, 0.10f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
