#include <widgetcore/ui/PrimitiveGroup.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace WC::UI {

namespace {

template <typename Command>
auto collect(std::span<PrimitiveGroup::Batch const> batches) -> std::vector<Command> {
    std::vector<Command> out;
    for (auto const& batch : batches) {
        if (auto const* items = std::get_if<std::vector<Command>>(&batch.items)) {
            out.insert(out.end(), items->begin(), items->end());
        }
    }
    return out;
}

} // namespace

auto PrimitiveGroup::Batch::kind() const -> Scene::DrawCommandKind {
    switch (items.index()) {
    case 0:
        return Scene::DrawCommandKind::SolidQuad;
    case 1:
        return Scene::DrawCommandKind::Quad;
    default:
        return Scene::DrawCommandKind::Text;
    }
}

auto PrimitiveGroup::Batch::size() const -> std::size_t {
    return std::visit([](auto const& list) { return list.size(); }, items);
}

template <typename Command>
auto PrimitiveGroup::append(std::vector<Command> commands) -> void {
    if (commands.empty()) {
        return;
    }
    // Batches stay sorted by z-index; equal z-indices keep insertion order.
    auto const pos = std::upper_bound(batches_.begin(), batches_.end(), z_index_,
                                      [](ZIndex z, Batch const& batch) { return z < batch.z_index; });
    if (pos != batches_.begin() && std::prev(pos)->z_index == z_index_) {
        if (auto* items = std::get_if<std::vector<Command>>(&std::prev(pos)->items)) {
            items->insert(items->end(),
                          std::make_move_iterator(commands.begin()),
                          std::make_move_iterator(commands.end()));
            return;
        }
    }
    batches_.insert(pos, Batch{z_index_, BatchItems{std::move(commands)}});
}

auto PrimitiveGroup::add(Scene::QuadCommand quad) -> void {
    std::vector<Scene::QuadCommand> list;
    list.push_back(std::move(quad));
    append(std::move(list));
}

auto PrimitiveGroup::add(Scene::SolidQuadCommand quad) -> void {
    std::vector<Scene::SolidQuadCommand> list;
    list.push_back(quad);
    append(std::move(list));
}

auto PrimitiveGroup::add_text(Scene::TextCommand text) -> void {
    std::vector<Scene::TextCommand> list;
    list.push_back(std::move(text));
    append(std::move(list));
}

auto PrimitiveGroup::add_quad_batch(std::vector<Scene::QuadCommand> quads) -> void {
    append(std::move(quads));
}

auto PrimitiveGroup::add_solid_quad_batch(std::vector<Scene::SolidQuadCommand> quads) -> void {
    append(std::move(quads));
}

auto PrimitiveGroup::add_text_batch(std::vector<Scene::TextCommand> texts) -> void {
    append(std::move(texts));
}

auto PrimitiveGroup::primitive_count() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& batch : batches_) {
        total += batch.size();
    }
    return total;
}

auto PrimitiveGroup::solid_quads() const -> std::vector<Scene::SolidQuadCommand> {
    return collect<Scene::SolidQuadCommand>(batches_);
}

auto PrimitiveGroup::quads() const -> std::vector<Scene::QuadCommand> {
    return collect<Scene::QuadCommand>(batches_);
}

auto PrimitiveGroup::texts() const -> std::vector<Scene::TextCommand> {
    return collect<Scene::TextCommand>(batches_);
}

auto PrimitiveGroup::clear() -> void {
    batches_.clear();
    z_index_ = 0;
}

} // namespace WC::UI
