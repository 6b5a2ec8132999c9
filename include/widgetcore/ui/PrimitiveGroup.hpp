#pragma once

#include <widgetcore/ui/DrawCommands.hpp>
#include <widgetcore/ui/Geometry.hpp>

#include <cstddef>
#include <span>
#include <variant>
#include <vector>

namespace WC::UI {

// Ordered, z-indexed sink for the primitives of one element. Batches come
// back in ascending z-index, insertion order within a z-index; consecutive
// primitives of the same kind and z-index share one batch.
class PrimitiveGroup {
public:
    using BatchItems = std::variant<std::vector<Scene::SolidQuadCommand>,
                                    std::vector<Scene::QuadCommand>,
                                    std::vector<Scene::TextCommand>>;

    struct Batch {
        ZIndex z_index = 0;
        BatchItems items;

        [[nodiscard]] auto kind() const -> Scene::DrawCommandKind;
        [[nodiscard]] auto size() const -> std::size_t;
    };

    auto set_z_index(ZIndex z_index) -> void { z_index_ = z_index; }
    [[nodiscard]] auto z_index() const -> ZIndex { return z_index_; }

    auto add(Scene::QuadCommand quad) -> void;
    auto add(Scene::SolidQuadCommand quad) -> void;
    auto add_text(Scene::TextCommand text) -> void;

    auto add_quad_batch(std::vector<Scene::QuadCommand> quads) -> void;
    auto add_solid_quad_batch(std::vector<Scene::SolidQuadCommand> quads) -> void;
    auto add_text_batch(std::vector<Scene::TextCommand> texts) -> void;

    [[nodiscard]] auto batches() const -> std::span<Batch const> { return batches_; }
    [[nodiscard]] auto empty() const -> bool { return batches_.empty(); }
    [[nodiscard]] auto primitive_count() const -> std::size_t;

    [[nodiscard]] auto solid_quads() const -> std::vector<Scene::SolidQuadCommand>;
    [[nodiscard]] auto quads() const -> std::vector<Scene::QuadCommand>;
    [[nodiscard]] auto texts() const -> std::vector<Scene::TextCommand>;

    auto clear() -> void;

private:
    template <typename Command>
    auto append(std::vector<Command> commands) -> void;

    ZIndex z_index_ = 0;
    std::vector<Batch> batches_;
};

} // namespace WC::UI
