#include <cassert>
#include <csetjmp>
#include <csignal>
#include <cstdio>
#include <memory>
#include <sprout/sprout.hpp>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

using namespace sprout;

struct Health {
    int hp;
};
struct Name {
    std::string value;
};
struct Root {};
struct Mid {
    int i;
};
struct Leaf {
    int i;
};
struct Marker {};
struct Owned {
    Entity owner;
};
struct Difficulty {
    int base;
};

// Reusable: counts every invocation.
struct Counted {
    std::shared_ptr<int> calls;
    std::tuple<Health, Name> spawn(const World&, Entity) const {
        ++*calls;
        return {Health{10}, Name{"counted"}};
    }
};

// Single-use: owns a move-only payload and consumes it.
struct OneShot {
    std::unique_ptr<int> payload;
    std::shared_ptr<int> calls;
    Health spawn_once(const World&, Entity) && {
        ++*calls;
        return Health{*payload};
    }
};

// Reads the world and the id of the entity being spawned.
struct Scaled {
    std::tuple<Owned, Health> spawn(const World& world, Entity entity) const {
        return {Owned{entity}, Health{world.resource<Difficulty>().base * 2}};
    }
};

static_assert(is_spawn_v<Counted>);
static_assert(is_spawn_v<Health>);
static_assert(is_spawn_v<Bundle>);
static_assert(is_spawn_v<std::tuple<Health, Name>>);
static_assert(is_spawn_once_v<OneShot>);
static_assert(!is_spawn_v<OneShot>);
static_assert(!is_spawn_v<SpawnChildren>);

static sigjmp_buf jump_buf;
static void abort_handler(int) {
    siglongjmp(jump_buf, 1);
}

static std::vector<Entity> children_of(World& w, Entity e) {
    if (auto* kids = w.try_get<Children>(e))
        return kids->entities;
    return {};
}

void test_spawn_key() {
    SpawnKey a("Enemy");
    SpawnKey b(std::string("Enemy"));
    assert(a == b);
    assert(a != SpawnKey("Friend"));
    assert(SpawnKeyHash{}(a) == SpawnKeyHash{}(b));
    std::ostringstream out;
    out << a;
    assert(out.str() == "SpawnKey(\"Enemy\")");
    std::printf("  spawn key: OK\n");
}

void test_register_and_query() {
    Spawnables registry;
    assert(registry.empty());
    SpawnKey key = registry.register_spawnable("Counted", Counted{std::make_shared<int>(0)});
    registry.register_spawnable("Plain", Health{3});
    assert(key == SpawnKey("Counted"));
    assert(registry.size() == 2);
    assert(registry.contains("Plain"));
    assert(!registry.contains("Missing"));
    assert(registry.fetch("Missing") == nullptr);
    assert(registry.keys().size() == 2);
    std::printf("  register and query: OK\n");
}

void test_duplicate_key_panics() {
    App app;
    app.add_plugin<SpawnPlugin>();
    add_spawnable(app, "Enemy", Health{1});

    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        add_spawnable(app, "Enemy", Health{2});
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    std::printf("  duplicate key panics: OK\n");
}

void test_spawn_with_key_components() {
    World w;
    w.set_resource(Spawnables{});
    auto calls = std::make_shared<int>(0);
    w.resource<Spawnables>().register_spawnable("Counted", Counted{calls});

    Bundle produced = w.resource<Spawnables>().fetch("Counted")->spawn(w, INVALID_ENTITY);
    assert(produced.size() == 2);

    Entity e = spawn_with_key(w, "Counted");
    assert(w.alive(e));
    assert(w.get<Health>(e).hp == 10);
    assert(w.get<Name>(e).value == "counted");
    assert(!w.has<SpawnChildren>(e));
    assert(!w.has<Parent>(e));
    assert(*calls == 2);
    std::printf("  spawn_with_key components: OK\n");
}

void test_unknown_key_panics() {
    World w;
    w.set_resource(Spawnables{});
    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        spawn_with_key(w, "Missing");
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    std::printf("  unknown key panics: OK\n");
}

void test_empty_key_panics() {
    Spawnables registry;
    assert(SpawnKey().name().empty());
    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        registry.register_spawnable(SpawnKey(), Health{1});
    } else {
        caught = true;
    }
    assert(caught);
    caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        registry.register_spawnable("", Health{1});
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    assert(registry.empty());
    assert(!registry.contains(SpawnKey()));
    std::printf("  empty key panics: OK\n");
}

void test_unbound_command_buffer_panics() {
    CommandBuffer cmds;
    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        spawn(cmds, Leaf{1});
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    assert(cmds.empty());
    std::printf("  unbound command buffer panics: OK\n");
}

void test_unknown_child_key_panics_at_flush() {
    World w;
    w.set_resource(Spawnables{});
    spawn_with_key(w.deferred(), "Missing");
    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        w.flush_deferred();
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    std::printf("  unknown key panics at flush: OK\n");
}

void test_nested_order_and_depth() {
    World w;
    w.set_resource(Spawnables{});
    Entity root = spawn(w, with_children(Root{}, [](SpawnChildBuilder& c) {
                            c.spawn(with_children(Mid{1}, [](SpawnChildBuilder& m) {
                                m.spawn(Leaf{1}).spawn(Leaf{2});
                            }));
                            c.spawn(Mid{2});
                            c.spawn(with_children(Mid{3}, [](SpawnChildBuilder& m) {
                                m.spawn(with_children(
                                    Leaf{3}, [](SpawnChildBuilder& l) { l.spawn(Leaf{4}); }));
                            }));
                        }));

    assert(w.has<Root>(root));
    assert(w.count<SpawnChildren>() == 0);
    assert(w.count() == 8);

    auto mids = children_of(w, root);
    assert(mids.size() == 3);
    for (int i = 0; i < 3; ++i) {
        assert(w.get<Mid>(mids[i]).i == i + 1);
        assert(w.get<Parent>(mids[i]).entity == root);
    }

    auto leaves = children_of(w, mids[0]);
    assert(leaves.size() == 2);
    assert(w.get<Leaf>(leaves[0]).i == 1);
    assert(w.get<Leaf>(leaves[1]).i == 2);
    assert(children_of(w, mids[1]).empty());

    auto deep = children_of(w, mids[2]);
    assert(deep.size() == 1 && w.get<Leaf>(deep[0]).i == 3);
    auto deepest = children_of(w, deep[0]);
    assert(deepest.size() == 1 && w.get<Leaf>(deepest[0]).i == 4);
    assert(w.get<Parent>(deepest[0]).entity == deep[0]);
    std::printf("  nested order and depth: OK\n");
}

void test_children_by_key() {
    World w;
    w.set_resource(Spawnables{});
    w.resource<Spawnables>().register_spawnable("Grunt", std::make_tuple(Health{5}, Name{"grunt"}));

    Entity squad = spawn(w, with_children(Name{"squad"}, [](SpawnChildBuilder& c) {
                             c.spawn_key("Grunt");
                             c.spawn_key_with("Grunt", Health{50});
                             c.spawn_key_with("Grunt", std::make_tuple(Name{"captain"}, Marker{}));
                         }));

    auto kids = children_of(w, squad);
    assert(kids.size() == 3);
    assert(w.get<Health>(kids[0]).hp == 5);
    assert(w.get<Health>(kids[1]).hp == 50);
    assert(w.get<Name>(kids[1]).value == "grunt");
    assert(w.get<Name>(kids[2]).value == "captain");
    assert(w.has<Marker>(kids[2]));
    assert(w.get<Health>(kids[2]).hp == 5);
    std::printf("  children by key: OK\n");
}

void test_spawn_with_key_extra() {
    World w;
    w.set_resource(Spawnables{});
    w.resource<Spawnables>().register_spawnable("Grunt", std::make_tuple(Health{5}, Name{"grunt"}));
    Entity e = spawn_with_key(w, "Grunt", Health{99});
    assert(w.get<Health>(e).hp == 99);
    assert(w.get<Name>(e).value == "grunt");

    Entity d = spawn_with_key(w.deferred(), "Grunt", Bundle::of(Marker{}));
    assert(!w.alive(d));
    w.flush_deferred();
    assert(w.has<Marker>(d) && w.get<Health>(d).hp == 5);
    std::printf("  spawn_with_key extra: OK\n");
}

void test_spawn_reads_world() {
    World w;
    w.set_resource(Spawnables{});
    w.set_resource(Difficulty{4});
    Entity e = spawn(w, Scaled{});
    assert(w.get<Owned>(e).owner == e);
    assert(w.get<Health>(e).hp == 8);

    Entity parent = spawn(w, with_children(Root{}, [](SpawnChildBuilder& c) { c.spawn(Scaled{}); }));
    Entity child = children_of(w, parent)[0];
    assert(w.get<Owned>(child).owner == child);
    std::printf("  spawn reads world: OK\n");
}

void test_single_use_invoked_once() {
    World w;
    w.set_resource(Spawnables{});
    auto calls = std::make_shared<int>(0);
    Entity e = spawn_once(w, OneShot{std::make_unique<int>(77), calls});
    assert(*calls == 1);
    assert(w.get<Health>(e).hp == 77);

    // As a child: consumed only when materialized, and only once
    Entity parent = w.create_with(spawn_children([&](SpawnChildBuilder& c) {
        c.spawn(OneShot{std::make_unique<int>(5), calls});
    }));
    assert(*calls == 1);
    invoke_spawn_children(w);
    assert(*calls == 2);
    invoke_spawn_children(w);
    assert(*calls == 2);
    assert(children_of(w, parent).size() == 1);
    std::printf("  single-use invoked once: OK\n");
}

void test_reusable_spawned_many_times() {
    World w;
    w.set_resource(Spawnables{});
    auto calls = std::make_shared<int>(0);
    Counted counted{calls};
    Entity a = spawn(w, counted);
    Entity b = spawn(w, counted);
    Entity c = spawn(w.deferred(), counted);
    w.flush_deferred();
    assert(*calls == 3);
    assert(a != b && b != c);

    w.get<Health>(a).hp = 1;
    assert(w.get<Health>(b).hp == 10);
    assert(w.get<Health>(c).hp == 10);

    // A reusable template with children yields independent subtrees
    auto tmpl = with_children(Root{}, [](SpawnChildBuilder& k) { k.spawn(Leaf{1}).spawn(Leaf{2}); });
    Entity r1 = spawn(w, tmpl);
    Entity r2 = spawn(w, tmpl);
    auto k1 = children_of(w, r1);
    auto k2 = children_of(w, r2);
    assert(k1.size() == 2 && k2.size() == 2);
    assert(k1[0] != k2[0]);
    assert(w.get<Parent>(k2[1]).entity == r2);
    std::printf("  reusable spawned many times: OK\n");
}

void test_materialization_idempotent() {
    World w;
    w.set_resource(Spawnables{});
    auto calls = std::make_shared<int>(0);
    Entity parent = w.create_with(Root{}, spawn_children([&](SpawnChildBuilder& c) {
                                      c.spawn(Counted{calls}).spawn(Counted{calls});
                                  }));
    assert(should_spawn_children(w));

    invoke_spawn_children(w);
    assert(!should_spawn_children(w));
    assert(!w.has<SpawnChildren>(parent));
    assert(children_of(w, parent).size() == 2);
    assert(*calls == 2);

    invoke_spawn_children(w);
    assert(children_of(w, parent).size() == 2);
    assert(w.count<Health>() == 2);
    assert(*calls == 2);
    std::printf("  materialization idempotent: OK\n");
}

struct LeafLog {
    std::vector<size_t> leaves_seen;
};

static void spawn_family(World& w) {
    spawn(w.deferred(), with_children(Root{}, [](SpawnChildBuilder& c) {
              c.spawn(Leaf{1}).spawn(Leaf{2});
          }));
}

static void log_leaves(World& w) {
    w.resource<LeafLog>().leaves_seen.push_back(w.count<Leaf>());
}

void test_deferred_until_hook() {
    App app;
    app.add_plugin<SpawnPlugin>();
    app.insert_resource(LeafLog{});
    app.add_systems(Stage::Startup,
                    {make_system("spawn_family", spawn_family), make_system("log_leaves", log_leaves)});
    app.add_system(Stage::Update, "log_leaves", log_leaves);
    assert(app.schedule().contains(Stage::First, "invoke_spawn_children"));

    app.update();
    auto& seen = app.world().resource<LeafLog>().leaves_seen;
    // Startup saw the parent but no children; the First hook ran before Update
    assert(seen.size() == 2);
    assert(seen[0] == 0);
    assert(seen[1] == 2);
    assert(app.world().count<Root>() == 1);

    app.update();
    assert(seen.size() == 3 && seen[2] == 2);
    std::printf("  deferred until hook: OK\n");
}

void test_forced_materialization() {
    App app;
    app.add_plugin<SpawnPlugin>();
    app.insert_resource(LeafLog{});
    app.add_systems(Stage::Startup, {make_system("spawn_family", spawn_family),
                                     force_spawn_children(), make_system("log_leaves", log_leaves)});
    app.update();
    auto& seen = app.world().resource<LeafLog>().leaves_seen;
    assert(seen.size() == 1);
    assert(seen[0] == 2);
    // The First hook found nothing left to do
    assert(app.world().count<Leaf>() == 2);
    std::printf("  forced materialization: OK\n");
}

void test_immediate_world_spawn() {
    World w;
    w.set_resource(Spawnables{});
    Entity root = spawn_once(w, with_children(Root{}, [](SpawnChildBuilder& c) {
                                 c.spawn(Leaf{1});
                             }));
    assert(w.count<Leaf>() == 1);
    assert(children_of(w, root).size() == 1);
    std::printf("  immediate world spawn: OK\n");
}

void test_plugin_custom_stage() {
    App app;
    app.add_plugin(SpawnPlugin(Stage::Update));
    assert(app.schedule().contains(Stage::Update, "invoke_spawn_children"));
    assert(!app.schedule().contains(Stage::First, "invoke_spawn_children"));

    Entity root = spawn(app.world().deferred(),
                        with_children(Root{}, [](SpawnChildBuilder& c) { c.spawn(Leaf{9}); }));
    app.update();
    assert(children_of(app.world(), root).size() == 1);
    std::printf("  plugin custom stage: OK\n");
}

void test_independent_worlds() {
    World w1;
    World w2;
    w1.set_resource(Spawnables{});
    w2.set_resource(Spawnables{});
    w1.resource<Spawnables>().register_spawnable("Unit", Health{1});
    w2.resource<Spawnables>().register_spawnable("Unit", Health{2});

    assert(w1.get<Health>(spawn_with_key(w1, "Unit")).hp == 1);
    assert(w2.get<Health>(spawn_with_key(w2, "Unit")).hp == 2);

    w1.resource<Spawnables>().register_spawnable("OnlyOne", Marker{});
    assert(!w2.resource<Spawnables>().contains("OnlyOne"));

    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        spawn_with_key(w2, "OnlyOne");
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    std::printf("  independent worlds: OK\n");
}

void test_register_during_materialization_panics() {
    World w;
    w.set_resource(Spawnables{});
    w.on_add<Marker>(std::function<void(World&, Entity, Marker&)>([](World& world, Entity, Marker&) {
        world.resource<Spawnables>().register_spawnable("Late", Health{1});
    }));

    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        spawn(w, with_children(Root{}, [](SpawnChildBuilder& c) { c.spawn(Marker{}); }));
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    std::printf("  register during materialization panics: OK\n");
}

void test_replace_registry_during_materialization_panics() {
    World w;
    w.set_resource(Spawnables{});
    w.resource<Spawnables>().register_spawnable("Grunt", Health{1});
    w.on_add<Leaf>(std::function<void(World&, Entity, Leaf&)>([](World& world, Entity, Leaf&) {
        world.set_resource(Spawnables{});
    }));

    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        spawn_once(w, with_children(Root{}, [](SpawnChildBuilder& c) { c.spawn(Leaf{1}); }));
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    // The registry in use was never freed
    assert(w.resource<Spawnables>().contains("Grunt"));
    std::printf("  replace registry during materialization panics: OK\n");
}

void test_remove_registry_during_materialization_panics() {
    World w;
    w.set_resource(Spawnables{});
    w.on_add<Leaf>(std::function<void(World&, Entity, Leaf&)>([](World& world, Entity, Leaf&) {
        world.remove_resource<Spawnables>();
    }));

    auto old_handler = signal(SIGABRT, abort_handler);
    bool caught = false;
    if (sigsetjmp(jump_buf, 1) == 0) {
        spawn_once(w, with_children(Root{}, [](SpawnChildBuilder& c) { c.spawn(Leaf{1}); }));
    } else {
        caught = true;
    }
    signal(SIGABRT, old_handler);
    assert(caught);
    assert(w.has_resource<Spawnables>());
    std::printf("  remove registry during materialization panics: OK\n");
}

void test_registry_unlocked_after_materialization() {
    World w;
    w.set_resource(Spawnables{});
    bool was_locked = false;
    bool was_materializing = false;
    w.on_add<Leaf>(std::function<void(World&, Entity, Leaf&)>([&](World& world, Entity, Leaf&) {
        was_locked = world.resource_locked<Spawnables>();
        was_materializing = world.resource<Spawnables>().materializing();
    }));
    spawn(w, with_children(Root{}, [](SpawnChildBuilder& c) { c.spawn(Leaf{1}); }));
    assert(was_locked && was_materializing);
    assert(!w.resource_locked<Spawnables>());
    assert(!w.resource<Spawnables>().materializing());

    // Swapping the registry between passes is fine
    w.set_resource(Spawnables{});
    w.resource<Spawnables>().register_spawnable("Late", Health{2});
    Entity e = spawn_with_key(w, "Late");
    assert(w.get<Health>(e).hp == 2);

    // A world without a registry is locked too, so none can be installed mid-pass
    World bare;
    bare.on_add<Leaf>(std::function<void(World&, Entity, Leaf&)>([&](World& world, Entity, Leaf&) {
        was_locked = world.resource_locked<Spawnables>();
    }));
    was_locked = false;
    spawn(bare, with_children(Root{}, [](SpawnChildBuilder& c) { c.spawn(Leaf{1}); }));
    assert(was_locked);
    assert(!bare.resource_locked<Spawnables>());
    std::printf("  registry unlocked after materialization: OK\n");
}

void test_instructions_inspection() {
    SpawnChildren pending = spawn_children([](SpawnChildBuilder& c) {
        c.spawn(Leaf{1}).spawn_key("Grunt").spawn_key_with("Grunt", Health{3});
    });
    assert(pending.size() == 3);
    auto& list = pending.instructions();
    assert(list[0].kind() == SpawnInstruction::Kind::Spawnable);
    assert(list[1].kind() == SpawnInstruction::Kind::Key);
    assert(list[1].key() == "Grunt");
    assert(list[1].extra().empty());
    assert(list[2].extra().has<Health>());
    std::printf("  instructions inspection: OK\n");
}

void test_with_children_appends() {
    World w;
    w.set_resource(Spawnables{});
    // The inner spawnable already carries pending children; the outer ones follow them
    auto inner = with_children(Root{}, [](SpawnChildBuilder& c) { c.spawn(Leaf{1}); });
    Entity root = spawn(w, with_children(inner, [](SpawnChildBuilder& c) { c.spawn(Leaf{2}); }));
    auto kids = children_of(w, root);
    assert(kids.size() == 2);
    assert(w.get<Leaf>(kids[0]).i == 1);
    assert(w.get<Leaf>(kids[1]).i == 2);
    std::printf("  with_children appends: OK\n");
}

void test_bundle_spawnable() {
    World w;
    w.set_resource(Spawnables{});
    Bundle tmpl = Bundle::of(Health{4}, Name{"bundle"});
    Entity a = spawn(w, tmpl);
    Entity b = spawn(w, tmpl);
    assert(tmpl.size() == 2);
    assert(w.get<Health>(a).hp == 4 && w.get<Name>(b).value == "bundle");
    std::printf("  bundle spawnable: OK\n");
}

int main() {
    std::printf("Running sprout spawn tests...\n");
    test_spawn_key();
    test_register_and_query();
    test_duplicate_key_panics();
    test_spawn_with_key_components();
    test_unknown_key_panics();
    test_empty_key_panics();
    test_unbound_command_buffer_panics();
    test_unknown_child_key_panics_at_flush();
    test_nested_order_and_depth();
    test_children_by_key();
    test_spawn_with_key_extra();
    test_spawn_reads_world();
    test_single_use_invoked_once();
    test_reusable_spawned_many_times();
    test_materialization_idempotent();
    test_deferred_until_hook();
    test_forced_materialization();
    test_immediate_world_spawn();
    test_plugin_custom_stage();
    test_independent_worlds();
    test_register_during_materialization_panics();
    test_replace_registry_during_materialization_panics();
    test_remove_registry_during_materialization_panics();
    test_registry_unlocked_after_materialization();
    test_instructions_inspection();
    test_with_children_appends();
    test_bundle_spawnable();
    std::printf("All tests passed.\n");
    return 0;
}
