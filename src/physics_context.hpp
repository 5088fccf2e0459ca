#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Collision/ContactListener.h>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

// Layer definitions
namespace Layers {
    static constexpr JPH::ObjectLayer NON_MOVING = 0;
    static constexpr JPH::ObjectLayer MOVING = 1;
    static constexpr JPH::ObjectLayer NUM_LAYERS = 2;
};

namespace BroadPhaseLayers {
    static constexpr JPH::BroadPhaseLayer NON_MOVING(0);
    static constexpr JPH::BroadPhaseLayer MOVING(1);
    static constexpr JPH::uint NUM_LAYERS(2);
};

// ---------------------------------------------------------------------------
// Layer filters (arena walls are NON_MOVING, pucks are MOVING)
// ---------------------------------------------------------------------------

class BPLayerInterfaceImpl final : public JPH::BroadPhaseLayerInterface {
public:
    BPLayerInterfaceImpl() {
        mObjectToBroadPhase[Layers::NON_MOVING] = BroadPhaseLayers::NON_MOVING;
        mObjectToBroadPhase[Layers::MOVING] = BroadPhaseLayers::MOVING;
    }

    virtual JPH::uint GetNumBroadPhaseLayers() const override {
        return BroadPhaseLayers::NUM_LAYERS;
    }

    virtual JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override {
        JPH_ASSERT(inLayer < Layers::NUM_LAYERS);
        return mObjectToBroadPhase[inLayer];
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    virtual const char *GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override {
        return inLayer == BroadPhaseLayers::NON_MOVING ? "NON_MOVING" : "MOVING";
    }
#endif // JPH_EXTERNAL_PROFILE || JPH_PROFILE_ENABLED

private:
    JPH::BroadPhaseLayer mObjectToBroadPhase[Layers::NUM_LAYERS];
};

class ObjectVsBroadPhaseLayerFilterImpl : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    virtual bool ShouldCollide(JPH::ObjectLayer inLayer1, JPH::BroadPhaseLayer inLayer2) const override {
        if (inLayer1 == Layers::NON_MOVING) return inLayer2 == BroadPhaseLayers::MOVING;
        return true;
    }
};

class ObjectLayerPairFilterImpl : public JPH::ObjectLayerPairFilter {
public:
    virtual bool ShouldCollide(JPH::ObjectLayer inObject1, JPH::ObjectLayer inObject2) const override {
        if (inObject1 == Layers::NON_MOVING) return inObject2 == Layers::MOVING;
        return true;
    }
};

// ---------------------------------------------------------------------------
// ContactQueue — collects contact-added points from Jolt worker threads.
// PhysicsSystem drains it on the main thread after each step.
// ---------------------------------------------------------------------------

class ContactQueue final : public JPH::ContactListener {
public:
    struct Contact {
        float       x, y;
        JPH::BodyID body1, body2;
    };

    virtual void OnContactAdded(const JPH::Body& inBody1, const JPH::Body& inBody2,
                                const JPH::ContactManifold& inManifold,
                                JPH::ContactSettings& /*ioSettings*/) override {
        if (!inBody1.IsDynamic() && !inBody2.IsDynamic()) return;
        if (inManifold.mRelativeContactPointsOn1.empty()) return;

        JPH::RVec3 p = inManifold.GetWorldSpaceContactPointOn1(0);
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back({static_cast<float>(p.GetX()), static_cast<float>(p.GetY()),
                            inBody1.GetID(), inBody2.GetID()});
    }

    std::vector<Contact> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Contact> out;
        out.swap(pending_);
        return out;
    }

private:
    std::mutex           mutex_;
    std::vector<Contact> pending_;
};

// ---------------------------------------------------------------------------
// Physics Context Resource
// ---------------------------------------------------------------------------

class PhysicsContext {
public:
    JPH::TempAllocatorImpl* temp_allocator = nullptr;
    JPH::JobSystemThreadPool* job_system = nullptr;
    JPH::PhysicsSystem* physics_system = nullptr;

    BPLayerInterfaceImpl broad_phase_layer_interface;
    ObjectVsBroadPhaseLayerFilterImpl object_vs_broadphase_layer_filter;
    ObjectLayerPairFilterImpl object_layer_pair_filter;
    ContactQueue contacts;

    static void InitJoltAllocator() {
        JPH::RegisterDefaultAllocator();
    }

    PhysicsContext() {
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();

        temp_allocator = new JPH::TempAllocatorImpl(10 * 1024 * 1024);
        const int workers = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
        job_system = new JPH::JobSystemThreadPool(JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, workers);

        physics_system = new JPH::PhysicsSystem();
        physics_system->Init(256, 0, 256, 256, broad_phase_layer_interface,
                             object_vs_broadphase_layer_filter, object_layer_pair_filter);
        // Default gravity stays on; the player opts out via gravity_scale = 0.
        physics_system->SetContactListener(&contacts);

        std::cout << "Jolt Physics Initialized." << std::endl;
    }

    ~PhysicsContext() {
        if (physics_system) delete physics_system;
        if (job_system) delete job_system;
        if (temp_allocator) delete temp_allocator;
        if (JPH::Factory::sInstance) {
             delete JPH::Factory::sInstance;
             JPH::Factory::sInstance = nullptr;
        }
    }

    PhysicsContext(const PhysicsContext&) = delete;
    PhysicsContext& operator=(const PhysicsContext&) = delete;

    JPH::BodyInterface& GetBodyInterface() { return physics_system->GetBodyInterface(); }
    const JPH::BodyInterface& GetBodyInterface() const { return physics_system->GetBodyInterface(); }
};
