#include "bench_main.hpp"

#include "pml/components/builtin.hpp"
#include "pml/element/builder.hpp"
#include "pml/formula/evaluator.hpp"
#include "pml/render/renderer.hpp"

#include <iostream>
#include <string>

using namespace pml;

static ElementPtr make_wide_document(const Builder& h, std::size_t sections) {
    Array children;
    children.reserve(sections + 1);
    for (std::size_t i = 0; i < sections; ++i) {
        const std::string name = "q" + std::to_string(i);
        children.push_back(h("Section",
                             Object{{"name", "s" + std::to_string(i)}},
                             {h("AskText", Object{{"name", name}, {"label", name}, {"default", "value"}}),
                              h("If", Object{{"when", "=" + name + " = \"value\""}}, {" matched"}),
                              h("Constraint", Object{{"type", "should"}}, {"stay short"})}));
    }
    children.push_back(h("Task", {}, {"summarize"}));
    return h("Prompt", Object{{"name", "wide"}}, std::move(children));
}

static ElementPtr make_deep_document(std::size_t depth) {
    Node node = "leaf";
    for (std::size_t i = 0; i < depth; ++i) {
        node = fragment({"-", node});
    }
    return fragment({node});
}

static void bench_render_wide(std::size_t sections) {
    const Builder h(components::builtin_registry());
    const auto doc = make_wide_document(h, sections);

    // 先渲染一次取得输出大小
    const auto probe = render(doc);
    if (!probe.ok) {
        std::cerr << "wide document failed to render\n";
        return;
    }

    BENCH_RUN("Render: " + std::to_string(sections) + " sections", probe.text.size(), 5, {
        auto result = render(doc);
        if (!result.ok) {
            std::cerr << "render failed\n";
        }
    });
}

static void bench_render_deep(std::size_t depth) {
    const auto doc = make_deep_document(depth);
    RenderOptions opts;
    opts.max_depth = depth + 2;

    const auto probe = render(doc, opts);
    BENCH_RUN("Render: nested fragments depth " + std::to_string(depth), probe.text.size(), 5, {
        auto result = render(doc, opts);
        if (!result.ok) {
            std::cerr << "render failed\n";
        }
    });
}

static void bench_formula(std::size_t iterations) {
    Object answers{{"a", 5}, {"b", "yes"}, {"c", Array{1, 2, 3}}};
    const std::string formula = "=AND(a > 3, OR(b = \"YES\", NOT(c)), a * 2 + 1 >= 11)";

    BENCH_RUN("Formula: evaluate x" + std::to_string(iterations), formula.size() * iterations, 5, {
        for (std::size_t i = 0; i < iterations; ++i) {
            auto result = formula::evaluate_formula(formula, answers);
            if (result.ec) {
                std::cerr << "formula failed: " << result.error_message << "\n";
                break;
            }
        }
    });
}

int main() {
    bench_render_wide(100);
    bench_render_wide(1000);
    bench_render_deep(200);
    bench_formula(10000);

    pml::benchmarks::print_results();
    return 0;
}
