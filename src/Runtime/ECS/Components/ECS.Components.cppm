export module ECS:Components;

export import :Components.Hierarchy;
export import :Components.SceneNode;
