// Copyright (c) 2013-2014 Sandstorm Development Group, Inc. and contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include <plank/test.fbs.h>
#include <kj/test.h>
#include <kj/vector.h>

namespace plank {
namespace test {
namespace {

KJ_TEST("hello request") {
  BufferBuilder builder;
  HelloRequest::Args args;
  args.name = builder.createString("world");
  auto message = finishMessage(builder, HelloRequest::create(builder, args));

  auto request = message.getRoot();
  KJ_EXPECT(request.hasName());
  KJ_EXPECT(request.getName() == "world");

  HelloRequest::Reader empty;
  KJ_EXPECT(empty.isNull());
  KJ_EXPECT(!empty.hasName());
  KJ_EXPECT(empty.getName() == "");
}

KJ_TEST("enum values are stored as their underlying integers") {
  KJ_EXPECT(static_cast<int32_t>(Foo::a) == 0);
  KJ_EXPECT(static_cast<int32_t>(Foo::b) == 1);
  KJ_EXPECT(static_cast<int32_t>(Foo::c) == 2);
  KJ_EXPECT(Monster::VT_FOO == slotToVoffset(16));

  BuilderOptions options;
  options.forceDefaults = true;
  BufferBuilder builder(options);
  auto name = builder.createString("Orc");
  Monster::Builder monster(builder);
  monster.setName(name);
  monster.setFoo(Foo::b);
  finishMonsterBuffer(builder, monster.finish());

  auto root = readMonster(builder.getBuffer());
  KJ_EXPECT(root.hasFoo());
  KJ_EXPECT(root.getFoo() == Foo::b);
  KJ_EXPECT(root.getTable().getScalar<int32_t>(Monster::VT_FOO, -1) == 1);
}

KJ_TEST("enum helpers") {
  KJ_EXPECT(kj::str(Color::Blue) == "Blue");
  KJ_EXPECT(static_cast<int8_t>(Color::Blue) == 8);
  auto blue = tryGetColor(8);
  KJ_EXPECT(KJ_ASSERT_NONNULL(blue) == Color::Blue);
  KJ_EXPECT(tryGetColor(3) == nullptr);

  auto both = Abilities::Fly | Abilities::Swim;
  KJ_EXPECT(static_cast<uint8_t>(both) == 3);
  KJ_EXPECT((both & Abilities::Swim) == Abilities::Swim);
  KJ_EXPECT(static_cast<uint8_t>(Abilities::Climb) == 4);
  KJ_EXPECT(tryGetAbilities(7) != nullptr);
  KJ_EXPECT(tryGetAbilities(8) == nullptr);

  KJ_EXPECT(kj::str(Equipment::Armor) == "Armor");
  KJ_EXPECT(tryGetEquipment(3) == nullptr);
}

KJ_TEST("structs have their declared layout") {
  KJ_EXPECT(sizeof(Vec3) == 12);
  KJ_EXPECT(sizeof(Padded) == 12);
  KJ_EXPECT(sizeof(Placement) == 16);
  KJ_EXPECT(sizeof(Aligned) == 16);
  KJ_EXPECT(alignof(Aligned) == 16);

  Padded padded(-1, 100000, 7);
  KJ_EXPECT(padded.getA() == -1);
  KJ_EXPECT(padded.getB() == 100000);
  KJ_EXPECT(padded.getC() == 7);

  // The in-memory image is little-endian and padding is zeroed.
  auto raw = reinterpret_cast<const byte*>(&padded);
  KJ_EXPECT(raw[0] == 0xff);
  byte expected[12] = { 0xff, 0, 0, 0, 0xa0, 0x86, 0x01, 0, 7, 0, 0, 0 };
  KJ_EXPECT(kj::arrayPtr(raw, 12) == kj::arrayPtr(expected, 12));

  Placement placement(Vec3(1, 2, 3), Color::Green, true);
  KJ_EXPECT(placement.getPos().getY() == 2.0f);
  placement.getPos().setY(5);
  KJ_EXPECT(placement.getPos().getY() == 5.0f);
  KJ_EXPECT(placement.getColor() == Color::Green);
  KJ_EXPECT(placement.getVisible());
}

KJ_TEST("monster") {
  BufferBuilder builder;

  auto name = builder.createString("Orc");
  uint8_t treasure[] = { 0, 1, 2, 3, 4 };
  auto inventory = builder.createVector<uint8_t>(kj::arrayPtr(treasure, 5));

  Weapon::Args swordArgs;
  swordArgs.name = builder.createString("Sword");
  swordArgs.damage = 3;
  auto sword = Weapon::create(builder, swordArgs);
  Weapon::Args axeArgs;
  axeArgs.name = builder.createString("Axe");
  axeArgs.damage = 5;
  auto axe = Weapon::create(builder, axeArgs);
  Offset<Weapon> weaponList[] = { sword, axe };
  auto weapons = builder.createVectorOfOffsets<Weapon>(kj::arrayPtr(weaponList, 2));

  Vec3 points[] = { Vec3(1, 2, 3), Vec3(4, 5, 6) };
  auto path = builder.createVectorOfStructs<Vec3>(kj::arrayPtr(points, 2));

  kj::StringPtr tagList[] = { "green", "angry" };
  auto tags = builder.createVectorOfStrings(kj::arrayPtr(tagList, 2));

  Placement placementList[] = {
    Placement(Vec3(0, 0, 0), Color::Red, false),
    Placement(Vec3(7, 8, 9), Color::Blue, true),
  };
  auto placements = builder.createVectorOfStructs<Placement>(kj::arrayPtr(placementList, 2));

  imported::Origin::Args originArgs;
  originArgs.planet = builder.createString("Mars");
  auto origin = imported::Origin::create(builder, originArgs);

  Monster::Args args;
  args.pos = Vec3(1, 2, 3);
  args.hp = 300;
  args.name = name;
  args.inventory = inventory;
  args.color = Color::Red;
  args.weapons = weapons;
  args.equippedType = Equipment::Weapon;
  args.equipped = axe.cast<void>();
  args.path = path;
  args.tags = tags;
  args.abilities = Abilities::Fly | Abilities::Climb;
  args.origin = origin;
  args.placements = placements;
  finishMonsterBuffer(builder, Monster::create(builder, args));

  auto monster = readMonster(builder.getBuffer());

  KJ_EXPECT(monster.hasPos());
  KJ_EXPECT(monster.getPos().getX() == 1.0f);
  KJ_EXPECT(monster.getPos().getZ() == 3.0f);
  KJ_EXPECT(monster.getHp() == 300);
  KJ_EXPECT(!monster.hasMana());
  KJ_EXPECT(monster.getMana() == 150);
  KJ_EXPECT(monster.getName() == "Orc");
  KJ_EXPECT(monster.getColor() == Color::Red);
  KJ_EXPECT(monster.getAbilities() == (Abilities::Fly | Abilities::Climb));
  KJ_EXPECT(monster.getRatio() == 0.5);

  auto readInventory = monster.getInventory();
  KJ_ASSERT(readInventory.size() == 5);
  uint total = 0;
  for (auto item: readInventory) total += item;
  KJ_EXPECT(total == 10);

  auto readWeapons = monster.getWeapons();
  KJ_ASSERT(readWeapons.size() == 2);
  KJ_EXPECT(readWeapons[0].getName() == "Sword");
  KJ_EXPECT(readWeapons[0].getDamage() == 3);
  KJ_EXPECT(readWeapons[1].getName() == "Axe");

  KJ_EXPECT(monster.getEquippedType() == Equipment::Weapon);
  auto equipped = monster.getEquippedAsWeapon();
  KJ_EXPECT(KJ_ASSERT_NONNULL(equipped).getDamage() == 5);
  KJ_EXPECT(monster.getEquippedAsArmor() == nullptr);

  auto readPath = monster.getPath();
  KJ_ASSERT(readPath.size() == 2);
  KJ_EXPECT(readPath[1].getY() == 5.0f);

  KJ_EXPECT(kj::strArray(monster.getTags(), " ") == "green angry");

  auto readPlacements = monster.getPlacements();
  KJ_ASSERT(readPlacements.size() == 2);
  KJ_EXPECT(readPlacements[1].getPos().getZ() == 9.0f);
  KJ_EXPECT(readPlacements[1].getColor() == Color::Blue);
  KJ_EXPECT(readPlacements[1].getVisible());
  KJ_EXPECT(!readPlacements[0].getVisible());

  KJ_EXPECT(monster.getOrigin().getPlanet() == "Mars");
  KJ_EXPECT(monster.getOrigin().getSector() == 7);

  KJ_EXPECT(!monster.hasStats());
  KJ_EXPECT(monster.getStats().size() == 0);
}

KJ_TEST("absent fields read as their defaults") {
  BufferBuilder builder;
  auto name = builder.createString("Ghost");
  Monster::Builder monster(builder);
  monster.setName(name);
  finishMonsterBuffer(builder, monster.finish());

  auto root = readMonster(builder.getBuffer());
  KJ_EXPECT(root.getName() == "Ghost");
  KJ_EXPECT(root.getMana() == 150);
  KJ_EXPECT(root.getHp() == 100);
  KJ_EXPECT(root.getColor() == Color::Blue);
  KJ_EXPECT(root.getRatio() == 0.5);
  KJ_EXPECT(root.getFoo() == Foo::b);
  KJ_EXPECT(static_cast<uint8_t>(root.getAbilities()) == 0);
  KJ_EXPECT(root.getEquippedType() == Equipment::NONE);
  KJ_EXPECT(root.getEquippedAsWeapon() == nullptr);
  KJ_EXPECT(!root.hasPos());
  KJ_EXPECT(root.getPos().getX() == 0.0f);
  KJ_EXPECT(root.getInventory().size() == 0);
  KJ_EXPECT(root.getOrigin().isNull());
  KJ_EXPECT(root.getOrigin().getSector() == 7);
  KJ_EXPECT(root.getOrigin().getPlanet() == "");
}

KJ_TEST("setting a field to its default leaves it out") {
  BufferBuilder builder;
  auto name = builder.createString("Imp");
  Monster::Builder monster(builder);
  monster.setName(name);
  monster.setMana(150);
  monster.setColor(Color::Blue);
  monster.setHp(99);
  finishMonsterBuffer(builder, monster.finish());

  auto root = readMonster(builder.getBuffer());
  KJ_EXPECT(!root.hasMana());
  KJ_EXPECT(!root.hasColor());
  KJ_EXPECT(root.hasHp());
  KJ_EXPECT(root.getHp() == 99);
}

KJ_TEST("limit defaults") {
  BufferBuilder builder;
  auto message = finishMessage(builder, Limits::create(builder, Limits::Args()));
  auto limits = message.getRoot();

  KJ_EXPECT(limits.getSmallest() == INT64_MIN);
  KJ_EXPECT(limits.getLargest() == UINT64_MAX);
  KJ_EXPECT(limits.getTiny() == -128);
  KJ_EXPECT(limits.getInfinite() == kj::inf());
  KJ_EXPECT(kj::isNaN(limits.getUndefined()));
  KJ_EXPECT(limits.getTruth());
  KJ_EXPECT(!limits.hasTruth());

  Limits::Args args;
  KJ_EXPECT(args.smallest == INT64_MIN);
  KJ_EXPECT(args.largest == UINT64_MAX);
  KJ_EXPECT(args.truth);
  args.truth = false;
  auto changed = finishMessage(builder, Limits::create(builder, args));
  KJ_EXPECT(changed.getRoot().hasTruth());
  KJ_EXPECT(!changed.getRoot().getTruth());
}

KJ_TEST("required field must be set") {
  BufferBuilder builder;
  {
    Monster::Builder monster(builder);
    monster.setHp(1);
    KJ_EXPECT_THROW_MESSAGE("required field was not set", monster.finish());
  }

  BufferBuilder other;
  Monster::Args args;
  args.hp = 5;
  KJ_EXPECT_THROW_MESSAGE("required field was not set", Monster::create(other, args));
}

KJ_TEST("deprecated field keeps its slot") {
  KJ_EXPECT(Monster::VT_FRIENDLY == slotToVoffset(4));
  KJ_EXPECT(Monster::VT_INVENTORY == slotToVoffset(5));

  BufferBuilder builder;
  auto name = builder.createString("Orc");
  Monster::Builder monster(builder);
  monster.setName(name);
  finishMonsterBuffer(builder, monster.finish());
  KJ_EXPECT(!readMonster(builder.getBuffer()).getTable().hasField(Monster::VT_FRIENDLY));
}

KJ_TEST("explicit field ids") {
  KJ_EXPECT(Versioned::VT_A == slotToVoffset(0));
  KJ_EXPECT(Versioned::VT_C == slotToVoffset(1));
  KJ_EXPECT(Versioned::VT_B == slotToVoffset(2));
  KJ_EXPECT(Versioned::VT_CHOICE_TYPE == slotToVoffset(3));
  KJ_EXPECT(Versioned::VT_CHOICE == slotToVoffset(4));

  BufferBuilder builder;
  Shield::Args shieldArgs;
  shieldArgs.armor = 25;
  auto shield = Shield::create(builder, shieldArgs);
  auto a = builder.createString("first");
  Versioned::Builder versioned(builder);
  versioned.setA(a);
  versioned.setB(2);
  versioned.setChoiceAsArmor(shield);
  auto message = finishMessage(builder, versioned.finish());

  auto root = message.getRoot();
  KJ_EXPECT(root.getA() == "first");
  KJ_EXPECT(root.getB() == 2);
  KJ_EXPECT(root.getC() == -1);
  KJ_EXPECT(root.getChoiceType() == Equipment::Armor);
  auto armor = root.getChoiceAsArmor();
  KJ_EXPECT(KJ_ASSERT_NONNULL(armor).getArmor() == 25);
  KJ_EXPECT(root.getChoiceAsWeapon() == nullptr);
}

KJ_TEST("lookup by key") {
  BufferBuilder builder;
  kj::StringPtr names[] = { "agility", "strength", "wisdom" };
  kj::Vector<Offset<Stat>> statList;
  for (int i = 0; i < 3; i++) {
    Stat::Args args;
    args.name = builder.createString(names[i]);
    args.value = (i + 1) * 10;
    statList.add(Stat::create(builder, args));
  }
  auto statVector = builder.createVectorOfOffsets<Stat>(statList.asPtr());
  auto name = builder.createString("Sage");

  Monster::Builder monster(builder);
  monster.setName(name);
  monster.setStats(statVector);
  finishMonsterBuffer(builder, monster.finish());

  auto root = readMonster(builder.getBuffer());
  auto stats = root.getStats();
  KJ_ASSERT(stats.size() == 3);

  auto strength = Stat::lookupByKey(stats, "strength");
  KJ_EXPECT(KJ_ASSERT_NONNULL(strength).getValue() == 20);
  auto agility = Stat::lookupByKey(stats, "agility");
  KJ_EXPECT(KJ_ASSERT_NONNULL(agility).getValue() == 10);
  auto wisdom = Stat::lookupByKey(stats, "wisdom");
  KJ_EXPECT(KJ_ASSERT_NONNULL(wisdom).getName() == "wisdom");
  KJ_EXPECT(Stat::lookupByKey(stats, "charm") == nullptr);
  KJ_EXPECT(Stat::lookupByKey(stats, "zzz") == nullptr);
  KJ_EXPECT(Stat::lookupByKey(VectorReader<Stat::Reader>(), "agility") == nullptr);
}

KJ_TEST("file identifier and extension") {
  KJ_EXPECT(kj::StringPtr(MONSTER_IDENTIFIER) == "MONS");
  KJ_EXPECT(kj::StringPtr(MONSTER_EXTENSION) == "mon");

  BufferBuilder builder;
  auto name = builder.createString("Orc");
  Monster::Builder monster(builder);
  monster.setName(name);
  finishMonsterBuffer(builder, monster.finish());
  KJ_EXPECT(monsterBufferHasIdentifier(builder.getBuffer()));

  BufferBuilder plain;
  auto request = HelloRequest::Builder(plain).finish();
  plain.finish(request);
  KJ_EXPECT(!monsterBufferHasIdentifier(plain.getBuffer()));
}

KJ_TEST("messages own their bytes") {
  BufferBuilder builder;
  HelloReply::Args args;
  args.message = builder.createString("hi there");
  auto message = finishMessage(builder, HelloReply::create(builder, args));
  KJ_EXPECT(builder.getSize() == 0);

  auto moved = kj::mv(message);
  KJ_EXPECT(moved.getRoot().getMessage() == "hi there");

  auto bytes = moved.releaseBytes();
  Message<HelloReply> again(kj::mv(bytes));
  KJ_EXPECT(again.getRoot().getMessage() == "hi there");

  byte garbage[4] = { 0xff, 0xff, 0, 0 };
  KJ_EXPECT_THROW_MESSAGE("offset points outside of buffer",
      Message<HelloReply>(kj::heapArray<byte>(kj::arrayPtr(garbage, 4))));
}

}  // namespace
}  // namespace test
}  // namespace plank
