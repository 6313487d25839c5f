export module ECS;

export import :Components;
