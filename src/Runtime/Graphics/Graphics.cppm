export module Graphics;

export import :ResourceKind;
export import :Camera;
export import :Geometry;
export import :Material;
export import :Texture;
export import :Light;
export import :Mesh;
export import :Scene;
export import :Renderer;
