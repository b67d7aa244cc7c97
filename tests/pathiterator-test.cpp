#include <doctest/doctest.h>

#include "fakeregistry.hpp"

#include <devnotify/pathiterator.hpp>

#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace {

using devnotify::DeviceIterator;
using devnotify::Handle;
using devnotify::Object;
using devnotify::PathIterator;
using devnotify::PathResolver;
using devnotify::test::FakeRegistry;

PathIterator makePaths (const std::shared_ptr<FakeRegistry>& registry,
        const std::vector<Handle>& devices, PathResolver resolver = PathResolver{}) {
    auto cursor = registry->newCursor(devices);
    return PathIterator{DeviceIterator{registry, Object{registry, cursor}}, std::move(resolver)};
}

static_assert(!std::is_copy_constructible<PathIterator>::value, "single consumer");
static_assert(std::is_move_constructible<PathIterator>::value, "movable");

TEST_CASE("the default resolver searches IOCalloutDevice recursively in the service plane") {
    FakeRegistry registry;
    auto device = registry.addDevice(std::string("/dev/cu.usbmodem1421"));

    auto path = PathResolver{}.resolve(registry, device);
    CHECK(path == std::string("/dev/cu.usbmodem1421"));

    REQUIRE(registry.lookups().size() == 1);
    const auto& lookup = registry.lookups().front();
    CHECK(lookup.entry == device);
    CHECK(lookup.plane == "IOService");
    CHECK(lookup.key == "IOCalloutDevice");
    CHECK(lookup.options == devnotify::kSearchRecursively);
}

TEST_CASE("a resolver can look up other properties") {
    FakeRegistry registry;
    auto device = registry.addDevice(std::string("disk2"));
    auto resolver = PathResolver{devnotify::kBsdNameKey, devnotify::kServicePlane,
        devnotify::kSearchRecursively | devnotify::kSearchParents};

    CHECK(resolver.resolve(registry, device) == std::string("disk2"));
    CHECK(registry.lookups().front().key == "BSD Name");
    CHECK(registry.lookups().front().options == 3u);
}

TEST_CASE("an absent property resolves to none, not an error") {
    FakeRegistry registry;
    auto device = registry.addDevice();
    CHECK_FALSE(bool(PathResolver{}.resolve(registry, device)));
}

TEST_CASE("the null handle resolves to none without a lookup") {
    FakeRegistry registry;
    CHECK_FALSE(bool(PathResolver{}.resolve(registry, 0)));
    CHECK(registry.lookups().empty());
}

TEST_CASE("a path iterator yields resolvable paths in device order, skipping the rest") {
    auto registry = std::make_shared<FakeRegistry>();
    auto a = registry->addDevice(std::string("/dev/cu.usbserial-A"));
    auto b = registry->addDevice();
    auto c = registry->addDevice(std::string("/dev/cu.usbserial-C"));
    auto d = registry->addDevice();
    auto e = registry->addDevice(std::string("/dev/cu.usbserial-E"));
    auto paths = makePaths(registry, {b, a, d, c, e, b});

    auto seen = std::vector<std::string>{};
    for (const auto& path : paths) {
        seen.push_back(path);
    }
    CHECK(seen == std::vector<std::string>{
        "/dev/cu.usbserial-A", "/dev/cu.usbserial-C", "/dev/cu.usbserial-E"});
    CHECK(paths.exhausted());
    CHECK_FALSE(bool(paths.next()));
    CHECK(registry->lookups().size() == 6);
}

TEST_CASE("a path iterator over unresolvable devices is empty") {
    auto registry = std::make_shared<FakeRegistry>();
    auto a = registry->addDevice();
    auto b = registry->addDevice();
    auto paths = makePaths(registry, {a, b});
    CHECK_FALSE(bool(paths.next()));
    CHECK(paths.exhausted());
}

TEST_CASE("a path iterator resolves lazily") {
    auto registry = std::make_shared<FakeRegistry>();
    auto a = registry->addDevice(std::string("/dev/cu.a"));
    auto b = registry->addDevice(std::string("/dev/cu.b"));
    auto paths = makePaths(registry, {a, b});
    CHECK(registry->lookups().empty());

    CHECK(paths.next() == std::string("/dev/cu.a"));
    CHECK(registry->lookups().size() == 1);
    CHECK_FALSE(paths.exhausted());
}

TEST_CASE("a path iterator releases every device and its cursor") {
    auto registry = std::make_shared<FakeRegistry>();
    auto a = registry->addDevice(std::string("/dev/cu.a"));
    auto b = registry->addDevice();
    auto c = registry->addDevice(std::string("/dev/cu.c"));

    SUBCASE("when drained") {
        auto paths = makePaths(registry, {a, b, c});
        while (paths.next()) {}
        CHECK(registry->outstandingRefs() == 0);
    }

    SUBCASE("when abandoned after the first path") {
        {
            auto paths = makePaths(registry, {a, b, c});
            CHECK(bool(paths.next()));
        }
        CHECK(registry->outstandingRefs() == 0);
    }

    CHECK(registry->badReleases() == 0);
}

}  // <anonymous>
