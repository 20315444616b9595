#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"

#include "render/PartialPathRenderer.h"
#include "render/RenderObject.h"
#include "render/Scene.h"

#include <QtGui/QVector3D>

#include <cmath>
#include <memory>
#include <vector>

namespace
{

std::vector<QVector3D> makePath(std::size_t count)
{
    std::vector<QVector3D> points;
    points.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        points.emplace_back(static_cast<float>(i), 0.0f, 0.0f);
    }
    return points;
}

std::size_t pathLinesIn(const render::Scene& scene)
{
    std::size_t count = 0;
    for (const auto& object : scene.objects())
    {
        if (object->kind() == render::RenderObject::Kind::PathLine)
        {
            ++count;
        }
    }
    return count;
}

// Storage the viewer would normally attach.
struct FakeGpu : render::GpuResource
{
};

} // namespace

DOCTEST_TEST_CASE(visible_point_count_formula)
{
    DOCTEST_CHECK(render::visiblePointCount(8, 0.0) == 0);
    DOCTEST_CHECK(render::visiblePointCount(8, -0.5) == 0);
    DOCTEST_CHECK(render::visiblePointCount(8, 1.0) == 8);
    DOCTEST_CHECK(render::visiblePointCount(8, 1.5) == 8);
    DOCTEST_CHECK(render::visiblePointCount(8, 0.01) == 2);
    DOCTEST_CHECK(render::visiblePointCount(8, 0.5) == 4);
    DOCTEST_CHECK(render::visiblePointCount(8, 0.51) == 5);
    DOCTEST_CHECK(render::visiblePointCount(8, std::nan("")) == 0);
    DOCTEST_CHECK(render::visiblePointCount(0, 0.5) == 0);

    for (int step = 1; step < 100; ++step)
    {
        const double progress = step / 100.0;
        const auto expected = std::max<std::size_t>(2, static_cast<std::size_t>(std::ceil(1'000 * progress)));
        DOCTEST_CHECK(render::visiblePointCount(1'000, progress) == expected);
    }
}

DOCTEST_TEST_CASE(render_slices_the_leading_vertices)
{
    render::Scene scene;
    render::PartialPathRenderer renderer(scene);
    const std::vector<QVector3D> path = makePath(10);

    const std::shared_ptr<render::PathLine> line = renderer.render(path, 0.35);

    DOCTEST_REQUIRE(line);
    DOCTEST_CHECK(line->pointCount() == 4);
    DOCTEST_CHECK(line->points().back() == path[3]);
    DOCTEST_CHECK(scene.contains(line.get()));
    DOCTEST_REQUIRE(renderer.toolPosition().has_value());
    DOCTEST_CHECK(*renderer.toolPosition() == path[3]);
}

DOCTEST_TEST_CASE(replaced_lines_are_disposed_and_detached)
{
    render::Scene scene;
    render::PartialPathRenderer renderer(scene);
    const std::vector<QVector3D> path = makePath(50);

    const std::shared_ptr<render::PathLine> first = renderer.render(path, 0.2);
    first->setGpuResource(std::make_unique<FakeGpu>());

    const std::shared_ptr<render::PathLine> second = renderer.render(path, 0.8);

    DOCTEST_CHECK(first != second);
    DOCTEST_CHECK(first->isDisposed());
    DOCTEST_CHECK(first->points().empty());
    DOCTEST_CHECK_FALSE(scene.contains(first.get()));
    DOCTEST_CHECK(scene.pendingReleaseCount() == 1);
    DOCTEST_CHECK_FALSE(second->isDisposed());
    DOCTEST_CHECK(scene.contains(second.get()));
}

DOCTEST_TEST_CASE(scrubbing_leaves_exactly_one_live_line)
{
    const std::size_t baseline = render::RenderObject::undisposedCount();
    {
        render::Scene scene;
        render::PartialPathRenderer renderer(scene);
        const std::vector<QVector3D> path = makePath(200);

        std::vector<std::shared_ptr<render::PathLine>> handed;
        for (int i = 0; i <= 100; ++i)
        {
            const double progress = (i % 2 == 0) ? i / 100.0 : 1.0 - i / 100.0;
            handed.push_back(renderer.render(path, progress));
        }

        DOCTEST_CHECK(pathLinesIn(scene) == 1);
        DOCTEST_CHECK(scene.size() == 1);
        DOCTEST_CHECK(render::RenderObject::undisposedCount() == baseline + 1);

        std::size_t live = 0;
        for (const auto& line : handed)
        {
            if (line && !line->isDisposed())
            {
                ++live;
                DOCTEST_CHECK(line == renderer.current());
            }
        }
        DOCTEST_CHECK(live >= 1);
    }
    DOCTEST_CHECK(render::RenderObject::undisposedCount() == baseline);
}

DOCTEST_TEST_CASE(unchanged_slice_reuses_the_current_line)
{
    render::Scene scene;
    render::PartialPathRenderer renderer(scene);
    const std::vector<QVector3D> path = makePath(10);

    const auto first = renderer.render(path, 0.31);
    const auto again = renderer.render(path, 0.33);

    DOCTEST_CHECK(first == again);
    DOCTEST_CHECK_FALSE(first->isDisposed());
    DOCTEST_CHECK(scene.revision() == 1);
}

DOCTEST_TEST_CASE(zero_progress_shows_nothing)
{
    render::Scene scene;
    render::PartialPathRenderer renderer(scene);
    const std::vector<QVector3D> path = makePath(10);

    renderer.render(path, 1.0);
    const auto line = renderer.render(path, 0.0);

    DOCTEST_REQUIRE(line);
    DOCTEST_CHECK(line->pointCount() == 0);
    DOCTEST_CHECK(renderer.visibleCount() == 0);
    DOCTEST_CHECK_FALSE(renderer.toolPosition().has_value());
    DOCTEST_CHECK(pathLinesIn(scene) == 1);
}

DOCTEST_TEST_CASE(clear_removes_the_line)
{
    render::Scene scene;
    render::PartialPathRenderer renderer(scene);
    const std::vector<QVector3D> path = makePath(10);

    const auto line = renderer.render(path, 0.5);
    renderer.clear();
    renderer.clear();

    DOCTEST_CHECK(line->isDisposed());
    DOCTEST_CHECK(scene.empty());
    DOCTEST_CHECK_FALSE(renderer.current());
}

DOCTEST_TEST_CASE(scene_rejects_invalid_attachments)
{
    render::Scene scene;
    auto line = std::make_shared<render::PathLine>(makePath(3), QVector3D{1.0f, 0.0f, 0.0f});

    DOCTEST_CHECK_FALSE(scene.attach(nullptr));
    DOCTEST_CHECK(scene.attach(line));
    DOCTEST_CHECK_FALSE(scene.attach(line));
    DOCTEST_CHECK(scene.size() == 1);

    DOCTEST_CHECK(scene.detach(line));
    DOCTEST_CHECK_FALSE(scene.detach(line));

    DOCTEST_CHECK(line->dispose());
    DOCTEST_CHECK_FALSE(line->dispose());
    DOCTEST_CHECK_FALSE(scene.attach(line));
}
