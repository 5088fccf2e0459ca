#include "physics.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <ecs/modules/transform.hpp>
#include <algorithm>
#include <iostream>
#include <memory>
#include <vector>

using namespace ecs;

// Collider depth along z; the simulation never moves bodies off the plane.
static constexpr float k_plane_half_depth = 0.5f;

void PhysicsSystem::Register(World& world) {
    world.on_add<RigidBodyConfig>([](World& w, Entity e, RigidBodyConfig& cfg) {
        if (w.has<RigidBodyHandle>(e)) return;

        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        auto& ctx = **ctx_ptr;

        JPH::BodyInterface& bi = ctx.GetBodyInterface();

        JPH::RefConst<JPH::Shape> shape;
        if (auto* box = w.try_get<BoxCollider>(e)) {
            shape = new JPH::BoxShape(JPH::Vec3(box->half_extents.x, box->half_extents.y,
                                                k_plane_half_depth));
        } else if (auto* circle = w.try_get<CircleCollider>(e)) {
            shape = new JPH::SphereShape(circle->radius);
        } else {
            shape = new JPH::SphereShape(0.5f);
        }

        JPH::Vec3 pos = JPH::Vec3::sZero();
        JPH::Quat rot = JPH::Quat::sIdentity();
        if (auto* lt = w.try_get<LocalTransform>(e)) {
            pos = MathBridge::ToJolt(lt->position);
            rot = MathBridge::ToJolt(lt->rotation);
        }

        JPH::EMotionType motion = JPH::EMotionType::Dynamic;
        if (cfg.type == BodyType::Static) motion = JPH::EMotionType::Static;
        if (cfg.type == BodyType::Kinematic) motion = JPH::EMotionType::Kinematic;

        JPH::ObjectLayer layer = (cfg.type == BodyType::Static) ? Layers::NON_MOVING : Layers::MOVING;

        JPH::BodyCreationSettings settings(shape, pos, rot, motion, layer);
        settings.mRestitution   = cfg.restitution;
        settings.mFriction      = cfg.friction;
        settings.mLinearDamping = cfg.linear_damping;
        settings.mGravityFactor = cfg.gravity_scale;

        if (cfg.type != BodyType::Static) {
            settings.mAllowedDOFs = JPH::EAllowedDOFs::Plane2D;
            settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
            settings.mMassPropertiesOverride.mMass = cfg.mass;
            if (cfg.ccd) settings.mMotionQuality = JPH::EMotionQuality::LinearCast;
        }

        JPH::Body* body = bi.CreateBody(settings);
        if (!body) {
            std::cerr << "PhysicsSystem: body limit reached, entity has no body" << std::endl;
            return;
        }
        bi.AddBody(body->GetID(), JPH::EActivation::Activate);

        w.add(e, RigidBodyHandle{body->GetID()});
    });

    world.on_remove<RigidBodyHandle>([](World& w, Entity, RigidBodyHandle& h) {
        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();
        bi.RemoveBody(h.id);
        bi.DestroyBody(h.id);
    });
}

void PhysicsSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    JPH::BodyInterface& bi = ctx.GetBodyInterface();

    // 1. Actuation: ControlSystem's requests -> Jolt
    world.each<RigidBodyHandle, ControlBody>([&](Entity, RigidBodyHandle& h, ControlBody& body) {
        {
            JPH::BodyLockWrite lock(ctx.physics_system->GetBodyLockInterface(), h.id);
            if (lock.Succeeded()) {
                if (auto* mp = lock.GetBody().GetMotionPropertiesUnchecked()) {
                    mp->SetLinearDamping(body.damping);
                }
            }
        }

        // One-shot: consumed by the first step after it was requested.
        if (body.impulse_pending) {
            bi.AddImpulse(h.id, MathBridge::ToJolt(body.impulse));
            body.impulse_pending = false;
            body.impulse = {0, 0};
        }

        // Jolt clears accumulated forces after every step, so the persistent
        // request is re-applied each step until ControlSystem clears it.
        if (!puck::math::is_zero(body.force)) {
            bi.AddForce(h.id, MathBridge::ToJolt(body.force));
        }
    });

    // 2. Step
    JPH::EPhysicsUpdateError err =
        ctx.physics_system->Update(dt, 1, ctx.temp_allocator, ctx.job_system);
    if (err != JPH::EPhysicsUpdateError::None) {
        std::cerr << "PhysicsSystem: update error " << static_cast<int>(err) << std::endl;
    }

    // 3. Sync: Jolt -> ECS (dynamic bodies only; static walls are driven by the scene)
    world.each<RigidBodyHandle, WorldTransform, RigidBodyConfig>(
        [&](Entity e, RigidBodyHandle& h, WorldTransform& wt, RigidBodyConfig& cfg) {
            if (cfg.type != BodyType::Dynamic) return;

            JPH::RVec3 pos;
            JPH::Quat rot;
            bi.GetPositionAndRotation(h.id, pos, rot);

            wt.matrix = mat4_compose(MathBridge::FromJolt(pos), MathBridge::FromJolt(rot), {1,1,1});

            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = MathBridge::FromJolt(pos);
                lt->rotation = MathBridge::FromJolt(rot);
            }
        });

    // 4. Velocity read-back for Accelerate
    world.each<RigidBodyHandle, ControlBody>([&](Entity, RigidBodyHandle& h, ControlBody& body) {
        body.linear_velocity = MathBridge::PlanarFromJolt(bi.GetLinearVelocity(h.id));
    });

    // 5. Contacts
    std::vector<JPH::BodyID> player_bodies;
    world.each<RigidBodyHandle, PlayerTag>([&](Entity, RigidBodyHandle& h, PlayerTag&) {
        player_bodies.push_back(h.id);
    });
    auto is_player = [&](const JPH::BodyID& id) {
        return std::find(player_bodies.begin(), player_bodies.end(), id) != player_bodies.end();
    };

    auto contacts = ctx.contacts.drain();
    if (auto* q = world.try_resource<Events<CollisionEvent>>()) {
        for (const auto& c : contacts) {
            q->send({{c.x, c.y}, is_player(c.body1) || is_player(c.body2)});
        }
    }
}
